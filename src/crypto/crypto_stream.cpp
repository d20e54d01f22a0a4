#include "crypto/crypto_stream.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace cirrus::crypto {

//=================================================
// RAII WRAPPER TO MANAGE CIPHER CONTEXT LIFECYCLE
//=================================================

struct CipherContext {
  EVP_CIPHER_CTX* ctx = nullptr;

  CipherContext() {
    ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
      throw EncryptionError("Failed to create cipher context");
    }
  }

  ~CipherContext() {
    if (ctx) {
      EVP_CIPHER_CTX_free(ctx);
    }
  }

  EVP_CIPHER_CTX* get() { return ctx; }
};

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CryptoStream::CryptoStream(std::istream& source, std::uint64_t length, const DerivedKey& key,
                           size_t chunk_size)
  : source_(source)
  , length_(length)
  , context_(std::make_unique<CipherContext>())
  , chunk_size_(chunk_size) {
  if (chunk_size_ == 0) {
    throw std::invalid_argument("Crypto stream: chunk size must be positive");
  }

  inbuf_.resize(chunk_size_);
  outbuf_.resize(chunk_size_ + EVP_MAX_BLOCK_LENGTH);
  initializeCipher(key);

  BOOST_LOG_TRIVIAL(debug) << "Crypto stream: Prepared to encrypt " << length_
                           << " bytes in chunks of " << chunk_size_;
}

CryptoStream::~CryptoStream() {
  BOOST_LOG_TRIVIAL(trace) << "Crypto stream: Releasing cipher context after "
                           << block_count_ << " blocks";
}

std::unique_ptr<CryptoStream> CryptoStream::encrypt(std::istream& source, std::uint64_t length,
                                                    const std::string& secret,
                                                    const ObjectContext& context,
                                                    size_t chunk_size) {
  auto key = KeyDerivation::derive(secret, context);
  return std::make_unique<CryptoStream>(source, length, key, chunk_size);
}

//==============================================
// CRYPTO UNIT INITIALIZATION
//==============================================

void CryptoStream::initializeCipher(const DerivedKey& key) {
  if (key.key.size() != KEY_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Crypto stream: Invalid key size: " << key.key.size()
                             << " bytes (expected " << KEY_SIZE << " bytes)";
    throw CipherContextError("Invalid key size");
  }
  if (key.iv.size() != IV_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Crypto stream: Invalid IV size: " << key.iv.size()
                             << " bytes (expected " << IV_SIZE << " bytes)";
    throw CipherContextError("Invalid IV size");
  }

  if (!EVP_EncryptInit_ex(context_->get(), EVP_aes_256_ctr(), nullptr, key.key.data(), key.iv.data())) {
    throw EncryptionError("Failed to initialize encryption context");
  }
}

//==============================================
// STREAM OPERATIONS
//==============================================

std::size_t CryptoStream::read(uint8_t* out, std::size_t max) {
  if (max == 0) {
    return 0;
  }

  if (pending_ == 0) {
    if (finalized_) {
      return 0;
    }
    refill();
    if (pending_ == 0) {
      return 0;
    }
  }

  size_t n = std::min(max, pending_);
  std::memcpy(out, outbuf_.data() + offset_, n);
  offset_ += n;
  pending_ -= n;
  return n;
}

std::ostream& CryptoStream::encrypt_to(std::ostream& output) {
  if (!output.good()) {
    throw std::runtime_error("Crypto stream: Invalid output stream state");
  }

  std::vector<uint8_t> buffer(chunk_size_);
  std::uint64_t written = 0;
  while (auto n = read(buffer.data(), buffer.size())) {
    output.write(reinterpret_cast<const char*>(buffer.data()), static_cast<std::streamsize>(n));
    if (!output.good()) {
      throw std::runtime_error("Crypto stream: Failed to write to output stream");
    }
    written += n;
  }

  output.flush();
  BOOST_LOG_TRIVIAL(debug) << "Crypto stream: Wrote " << written << " ciphertext bytes";
  return output;
}

//==============================================
// STREAM PROCESSING
//==============================================

void CryptoStream::refill() {
  offset_ = 0;
  pending_ = 0;

  if (consumed_ >= length_) {
    processFinalBlock();
    return;
  }

  auto wanted = static_cast<size_t>(std::min<std::uint64_t>(chunk_size_, length_ - consumed_));
  auto bytes_read = readSourceChunk(wanted);

  BOOST_LOG_TRIVIAL(trace) << "Crypto stream: Processing block " << block_count_
                           << ": Read " << bytes_read << " bytes"
                           << " (total consumed so far: " << consumed_ << ")";

  pending_ = processDataBlock(inbuf_.data(), bytes_read, outbuf_.data());
  consumed_ += bytes_read;
  block_count_++;

  if (consumed_ == length_) {
    BOOST_LOG_TRIVIAL(debug) << "Crypto stream: Source exhausted after " << block_count_ << " blocks";
  }
}

size_t CryptoStream::readSourceChunk(size_t wanted) {
  size_t total = 0;

  // istream::read may return short on pipes and sockets; keep reading until
  // the chunk is full or the stream gives up
  while (total < wanted) {
    source_.read(reinterpret_cast<char*>(inbuf_.data() + total),
                 static_cast<std::streamsize>(wanted - total));
    auto got = static_cast<size_t>(source_.gcount());
    total += got;

    if (source_.bad()) {
      BOOST_LOG_TRIVIAL(error) << "Crypto stream: Source stream failed after "
                               << consumed_ + total << " bytes";
      throw StreamReadError("Source stream failed after " + std::to_string(consumed_ + total) + " bytes");
    }
    if (got == 0 || source_.eof()) {
      break;
    }
  }

  if (total < wanted) {
    BOOST_LOG_TRIVIAL(error) << "Crypto stream: Source ended at " << consumed_ + total
                             << " bytes, expected " << length_;
    throw StreamReadError("Source ended after " + std::to_string(consumed_ + total) +
                          " of " + std::to_string(length_) + " bytes");
  }
  return total;
}

size_t CryptoStream::processDataBlock(const uint8_t* inbuf, size_t bytes_read, uint8_t* outbuf) {
  int outlen = 0;
  if (!EVP_EncryptUpdate(context_->get(), outbuf, &outlen, inbuf, static_cast<int>(bytes_read))) {
    throw EncryptionError("Failed to encrypt data block");
  }
  return static_cast<size_t>(outlen);
}

void CryptoStream::processFinalBlock() {
  BOOST_LOG_TRIVIAL(debug) << "Crypto stream: Finalizing encryption";

  int outlen = 0;
  if (!EVP_EncryptFinal_ex(context_->get(), outbuf_.data(), &outlen)) {
    throw EncryptionError("Failed to finalize encryption");
  }
  pending_ = static_cast<size_t>(outlen);
  finalized_ = true;

  BOOST_LOG_TRIVIAL(info) << "Crypto stream: Completed encryption: Processed "
                          << consumed_ << " bytes in " << block_count_ << " blocks";
}

} // namespace cirrus::crypto
