#ifndef CIRRUS_CRYPTO_ERROR_HPP
#define CIRRUS_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace cirrus::crypto {

class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& message) 
        : std::runtime_error(message) {}
};

// Key derivation inputs are malformed (empty secret, bad bucket id, bad index)
class CipherContextError : public CryptoError {
public:
    explicit CipherContextError(const std::string& message) 
        : CryptoError("Cipher context error: " + message) {}
};

// The plaintext source failed or ended before its declared length
class StreamReadError : public CryptoError {
public:
    explicit StreamReadError(const std::string& message) 
        : CryptoError("Stream read error: " + message) {}
};

class EncryptionError : public CryptoError {
public:
    explicit EncryptionError(const std::string& message) 
        : CryptoError("Encryption error: " + message) {}
};

} // namespace cirrus::crypto

#endif // CIRRUS_CRYPTO_ERROR_HPP
