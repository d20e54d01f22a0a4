#ifndef CIRRUS_CRYPTO_CONTENT_HASH_HPP
#define CIRRUS_CRYPTO_CONTENT_HASH_HPP

#include <cstdint>
#include <memory>
#include <string>
#include "crypto_error.hpp"
#include "io/byte_source.hpp"

namespace cirrus::crypto {

struct DigestContext;

// Incremental RIPEMD-160(SHA-256(data)), the shard hash the storage network
// expects when an object is committed
class ContentHash {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  ContentHash();
  ~ContentHash();

  ContentHash(const ContentHash&) = delete;
  ContentHash& operator=(const ContentHash&) = delete;


  // ---- HASHING ----
  void update(const uint8_t* data, std::size_t size);
  // Lowercase hex digest; the hash cannot be updated afterwards
  std::string finish();

  // One-shot helper
  static std::string of(const std::string& data);

private:
  std::unique_ptr<DigestContext> context_;
  bool finished_ = false;
};

// Passes bytes through from another source while hashing them
class HashingSource : public io::ByteSource {
public:
  explicit HashingSource(io::ByteSource& inner);

  std::size_t read(uint8_t* out, std::size_t max) override;
  std::uint64_t size() const override { return inner_.size(); }

  std::uint64_t bytes_hashed() const { return hashed_; }
  // Throws std::logic_error unless every byte of the inner source went through
  std::string digest();

private:
  io::ByteSource& inner_;
  ContentHash hash_;
  std::uint64_t hashed_ = 0;
  std::string digest_;
};

} // namespace cirrus::crypto

#endif // CIRRUS_CRYPTO_CONTENT_HASH_HPP
