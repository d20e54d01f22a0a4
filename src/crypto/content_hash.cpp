#include "crypto/content_hash.hpp"
#include "crypto/encoding.hpp"
#include <openssl/evp.h>
#include <stdexcept>
#include <vector>
#include <boost/log/trivial.hpp>

namespace cirrus::crypto {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw EncryptionError("Failed to create digest context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  EVP_MD_CTX* get() { return ctx; }
};

//==============================================
// CONTENT HASH
//==============================================

ContentHash::ContentHash()
  : context_(std::make_unique<DigestContext>()) {
  if (!EVP_DigestInit_ex(context_->get(), EVP_sha256(), nullptr)) {
    throw EncryptionError("Failed to initialize SHA-256");
  }
}

ContentHash::~ContentHash() = default;

void ContentHash::update(const uint8_t* data, std::size_t size) {
  if (finished_) {
    throw std::logic_error("Content hash: update after finish");
  }
  if (size > 0 && !EVP_DigestUpdate(context_->get(), data, size)) {
    throw EncryptionError("Failed to hash data block");
  }
}

std::string ContentHash::finish() {
  if (finished_) {
    throw std::logic_error("Content hash: already finished");
  }
  finished_ = true;

  std::vector<uint8_t> sha(EVP_MAX_MD_SIZE);
  unsigned int sha_len = 0;
  if (!EVP_DigestFinal_ex(context_->get(), sha.data(), &sha_len)) {
    throw EncryptionError("Failed to finalize SHA-256");
  }

  std::vector<uint8_t> digest(EVP_MAX_MD_SIZE);
  unsigned int digest_len = 0;
  if (!EVP_Digest(sha.data(), sha_len, digest.data(), &digest_len, EVP_ripemd160(), nullptr)) {
    throw EncryptionError("Failed to compute RIPEMD-160 digest");
  }
  digest.resize(digest_len);
  return to_hex(digest);
}

std::string ContentHash::of(const std::string& data) {
  ContentHash hash;
  hash.update(reinterpret_cast<const uint8_t*>(data.data()), data.size());
  return hash.finish();
}

//==============================================
// HASHING SOURCE
//==============================================

HashingSource::HashingSource(io::ByteSource& inner)
  : inner_(inner) {}

std::size_t HashingSource::read(uint8_t* out, std::size_t max) {
  auto n = inner_.read(out, max);
  hash_.update(out, n);
  hashed_ += n;
  return n;
}

std::string HashingSource::digest() {
  if (!digest_.empty()) {
    return digest_;
  }
  if (hashed_ != inner_.size()) {
    throw std::logic_error("Content hash requested after " + std::to_string(hashed_) +
                           " of " + std::to_string(inner_.size()) + " bytes");
  }
  digest_ = hash_.finish();
  BOOST_LOG_TRIVIAL(debug) << "Content hash: " << digest_ << " over " << hashed_ << " bytes";
  return digest_;
}

} // namespace cirrus::crypto
