#include "crypto/key_derivation.hpp"
#include "crypto/encoding.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace cirrus::crypto {

//==============================================
// DERIVATION
//==============================================

DerivedKey KeyDerivation::derive(const std::string& secret, const ObjectContext& context) {
  BOOST_LOG_TRIVIAL(debug) << "Key derivation: Deriving object key for bucket " << context.bucket_id;

  validate(secret, context);

  auto seed = secret_to_seed(secret);
  auto bkey = bucket_key(seed, context.bucket_id);

  DerivedKey derived;
  derived.key = file_key(bkey, context.index);
  derived.iv.assign(context.index.begin(), context.index.begin() + IV_SIZE);

  BOOST_LOG_TRIVIAL(debug) << "Key derivation: Object key derived";
  return derived;
}

std::vector<uint8_t> KeyDerivation::secret_to_seed(const std::string& secret) {
  if (secret.empty()) {
    throw CipherContextError("Shared secret is empty");
  }

  static const std::string salt = "mnemonic";
  std::vector<uint8_t> seed(SEED_SIZE);

  if (!PKCS5_PBKDF2_HMAC(secret.data(), static_cast<int>(secret.size()),
                         reinterpret_cast<const unsigned char*>(salt.data()),
                         static_cast<int>(salt.size()),
                         SEED_ITERATIONS, EVP_sha512(),
                         static_cast<int>(seed.size()), seed.data())) {
    throw CipherContextError("Failed to stretch shared secret");
  }
  return seed;
}

std::vector<uint8_t> KeyDerivation::bucket_key(const std::vector<uint8_t>& seed, const std::string& bucket_id) {
  std::vector<uint8_t> bucket_bytes;
  try {
    bucket_bytes = from_hex(bucket_id);
  } catch (const std::invalid_argument& e) {
    throw CipherContextError("Bucket id is not valid hex: " + std::string(e.what()));
  }

  auto digest = deterministic_key(seed, bucket_bytes);
  digest.resize(KEY_SIZE);
  return digest;
}

std::vector<uint8_t> KeyDerivation::file_key(const std::vector<uint8_t>& bucket_key,
                                             const std::vector<uint8_t>& index) {
  auto digest = deterministic_key(bucket_key, index);
  digest.resize(KEY_SIZE);
  return digest;
}

std::vector<uint8_t> KeyDerivation::deterministic_key(const std::vector<uint8_t>& key,
                                                      const std::vector<uint8_t>& data) {
  std::vector<uint8_t> input;
  input.reserve(key.size() + data.size());
  input.insert(input.end(), key.begin(), key.end());
  input.insert(input.end(), data.begin(), data.end());

  std::vector<uint8_t> digest(SHA512_DIGEST_LENGTH);
  unsigned int digest_len = 0;
  if (!EVP_Digest(input.data(), input.size(), digest.data(), &digest_len, EVP_sha512(), nullptr)) {
    throw CipherContextError("Failed to compute SHA-512 digest");
  }
  digest.resize(digest_len);
  return digest;
}

void KeyDerivation::validate(const std::string& secret, const ObjectContext& context) {
  if (secret.empty()) {
    BOOST_LOG_TRIVIAL(error) << "Key derivation: Empty shared secret";
    throw CipherContextError("Shared secret is empty");
  }
  if (context.bucket_id.empty()) {
    BOOST_LOG_TRIVIAL(error) << "Key derivation: Empty bucket id";
    throw CipherContextError("Bucket id is empty");
  }
  if (context.index.size() != INDEX_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Key derivation: Invalid index size: " << context.index.size()
                             << " bytes (expected " << INDEX_SIZE << " bytes)";
    throw CipherContextError("Invalid object index size");
  }
}

//==============================================
// INDEX GENERATION
//==============================================

std::vector<uint8_t> KeyDerivation::generate_index() {
  BOOST_LOG_TRIVIAL(debug) << "Key derivation: Generating object index";

  std::vector<uint8_t> index(INDEX_SIZE);
  if (RAND_bytes(index.data(), static_cast<int>(index.size())) != 1) {
    throw CipherContextError("Failed to generate random object index");
  }
  return index;
}

} // namespace cirrus::crypto
