#ifndef CIRRUS_CRYPTO_STREAM_HPP
#define CIRRUS_CRYPTO_STREAM_HPP

#include <cstdint>
#include <istream>
#include <ostream>
#include <vector>
#include <memory>
#include <string>
#include "crypto_error.hpp"
#include "key_derivation.hpp"
#include "io/byte_source.hpp"

namespace cirrus::crypto {

// Forward declaration for OpenSSL cipher context
struct CipherContext;

// Lazily encrypts a plaintext stream with AES-256-CTR. Ciphertext is produced
// chunk by chunk as read() is called, so memory stays bounded by one chunk no
// matter how large the source is. The cipher state only moves forward; an
// instance encrypts exactly one source and cannot be reset.
class CryptoStream : public io::ByteSource {
public:
  static constexpr size_t KEY_SIZE = KeyDerivation::KEY_SIZE;
  static constexpr size_t IV_SIZE = KeyDerivation::IV_SIZE;
  static constexpr size_t DEFAULT_CHUNK_SIZE = 64 * 1024;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  CryptoStream(std::istream& source, std::uint64_t length, const DerivedKey& key,
               size_t chunk_size = DEFAULT_CHUNK_SIZE);
  ~CryptoStream() override;

  CryptoStream(const CryptoStream&) = delete;
  CryptoStream& operator=(const CryptoStream&) = delete;

  // Derives the object key from the shared secret and wraps source
  static std::unique_ptr<CryptoStream> encrypt(std::istream& source, std::uint64_t length,
                                               const std::string& secret,
                                               const ObjectContext& context,
                                               size_t chunk_size = DEFAULT_CHUNK_SIZE);


  // ---- STREAM OPERATIONS ----
  // Returns up to max ciphertext bytes, 0 once the whole source was encrypted
  std::size_t read(uint8_t* out, std::size_t max) override;
  std::uint64_t size() const override { return length_; }
  // Drains the remaining ciphertext into output
  std::ostream& encrypt_to(std::ostream& output);


  // ---- GETTERS ----
  std::uint64_t bytes_consumed() const { return consumed_; }
  bool finished() const { return finalized_ && pending_ == 0; }

private:
  // ---- PARAMETERS ----
  std::istream& source_;
  std::uint64_t length_;
  std::uint64_t consumed_ = 0;
  std::unique_ptr<CipherContext> context_;
  size_t chunk_size_;
  std::vector<uint8_t> inbuf_;
  std::vector<uint8_t> outbuf_;
  size_t offset_ = 0;      // read position in outbuf_
  size_t pending_ = 0;     // ciphertext bytes left in outbuf_
  bool finalized_ = false;
  size_t block_count_ = 0;


  // ---- INITIALIZATION ----
  void initializeCipher(const DerivedKey& key);


  // ---- STREAM PROCESSING ----
  // Reads and encrypts the next chunk of the source into outbuf_
  void refill();
  // Reads exactly the requested number of plaintext bytes or throws StreamReadError
  size_t readSourceChunk(size_t wanted);
  // Encrypts a single chunk using the configured cipher
  size_t processDataBlock(const uint8_t* inbuf, size_t bytes_read, uint8_t* outbuf);
  // Flushes whatever the cipher still holds once the source is exhausted
  void processFinalBlock();
};

} // namespace cirrus::crypto

#endif // CIRRUS_CRYPTO_STREAM_HPP
