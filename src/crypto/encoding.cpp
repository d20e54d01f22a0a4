#include "crypto/encoding.hpp"
#include "crypto/crypto_error.hpp"
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <array>
#include <stdexcept>

namespace cirrus::crypto {

namespace {

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

std::string to_hex(const std::vector<uint8_t>& bytes) {
  static const char digits[] = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2);
  for (uint8_t b : bytes) {
    out.push_back(digits[b >> 4]);
    out.push_back(digits[b & 0x0F]);
  }
  return out;
}

std::vector<uint8_t> from_hex(const std::string& hex) {
  if (hex.size() % 2 != 0) {
    throw std::invalid_argument("Hex string has odd length");
  }

  std::vector<uint8_t> out(hex.size() / 2);
  for (size_t i = 0; i < out.size(); ++i) {
    int hi = hex_value(hex[2 * i]);
    int lo = hex_value(hex[2 * i + 1]);
    if (hi < 0 || lo < 0) {
      throw std::invalid_argument("Hex string contains a non-hex character");
    }
    out[i] = static_cast<uint8_t>((hi << 4) | lo);
  }
  return out;
}

std::string base64_encode(const std::string& data) {
  // EVP_EncodeBlock writes 4 bytes per 3 input bytes plus a terminator
  std::vector<unsigned char> out(4 * ((data.size() + 2) / 3) + 1);
  int written = EVP_EncodeBlock(out.data(),
                                reinterpret_cast<const unsigned char*>(data.data()),
                                static_cast<int>(data.size()));
  if (written < 0) {
    throw EncryptionError("Failed to base64 encode data");
  }
  return std::string(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(written));
}

std::string sha256_hex(const std::string& data) {
  std::array<uint8_t, SHA256_DIGEST_LENGTH> digest;
  unsigned int digest_len = 0;

  if (!EVP_Digest(data.data(), data.size(), digest.data(), &digest_len, EVP_sha256(), nullptr)) {
    throw EncryptionError("Failed to compute SHA-256 digest");
  }
  return to_hex(std::vector<uint8_t>(digest.begin(), digest.begin() + digest_len));
}

} // namespace cirrus::crypto
