#ifndef CIRRUS_CRYPTO_KEY_DERIVATION_HPP
#define CIRRUS_CRYPTO_KEY_DERIVATION_HPP

#include <array>
#include <cstdint>
#include <string>
#include <vector>
#include "crypto_error.hpp"

namespace cirrus::crypto {

// Identifies one stored object under an account secret. Two objects sharing a
// bucket must never share an index.
struct ObjectContext {
  std::string bucket_id;        // hex encoded
  std::vector<uint8_t> index;   // INDEX_SIZE random bytes
};

// Per-object key material handed to the cipher
struct DerivedKey {
  std::vector<uint8_t> key;
  std::vector<uint8_t> iv;
};

class KeyDerivation {
public:
  static constexpr size_t KEY_SIZE = 32;      // AES-256
  static constexpr size_t IV_SIZE = 16;       // CTR initial counter block
  static constexpr size_t INDEX_SIZE = 32;
  static constexpr size_t SEED_SIZE = 64;
  static constexpr int SEED_ITERATIONS = 2048;

  // ---- DERIVATION ----
  // Derives the file key and IV for an object:
  //   seed       = PBKDF2-HMAC-SHA512(secret, "mnemonic", 2048)
  //   bucket key = SHA512(seed || bucket_id)[0:32]
  //   file key   = SHA512(bucket key || index)[0:32]
  //   iv         = index[0:16]
  static DerivedKey derive(const std::string& secret, const ObjectContext& context);

  // Stretches the account secret into a 64 byte seed
  static std::vector<uint8_t> secret_to_seed(const std::string& secret);
  static std::vector<uint8_t> bucket_key(const std::vector<uint8_t>& seed, const std::string& bucket_id);
  static std::vector<uint8_t> file_key(const std::vector<uint8_t>& bucket_key,
                                       const std::vector<uint8_t>& index);

  // ---- INDEX GENERATION ----
  static std::vector<uint8_t> generate_index();

private:
  // SHA512(key || data)
  static std::vector<uint8_t> deterministic_key(const std::vector<uint8_t>& key,
                                                const std::vector<uint8_t>& data);
  static void validate(const std::string& secret, const ObjectContext& context);
};

} // namespace cirrus::crypto

#endif // CIRRUS_CRYPTO_KEY_DERIVATION_HPP
