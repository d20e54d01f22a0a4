#ifndef CIRRUS_CRYPTO_ENCODING_HPP
#define CIRRUS_CRYPTO_ENCODING_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace cirrus::crypto {

// Lowercase hex representation of raw bytes
std::string to_hex(const std::vector<uint8_t>& bytes);

// Decodes a hex string, throws std::invalid_argument on odd length or bad digits
std::vector<uint8_t> from_hex(const std::string& hex);

// Standard base64 with padding, no line breaks
std::string base64_encode(const std::string& data);

// SHA-256 of the input as lowercase hex
std::string sha256_hex(const std::string& data);

} // namespace cirrus::crypto

#endif // CIRRUS_CRYPTO_ENCODING_HPP
