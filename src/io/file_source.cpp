#include "io/file_source.hpp"
#include "crypto/crypto_error.hpp"
#include <algorithm>
#include <system_error>
#include <boost/log/trivial.hpp>

namespace cirrus {
namespace io {

FileSource::FileSource(const std::filesystem::path& path)
  : path_(path)
  , size_(0) {
  BOOST_LOG_TRIVIAL(debug) << "File source: Opening " << path_.string();

  std::error_code ec;
  if (!std::filesystem::is_regular_file(path_, ec)) {
    BOOST_LOG_TRIVIAL(error) << "File source: Not a regular file: " << path_.string();
    throw crypto::StreamReadError("Not a regular file: " + path_.string());
  }

  size_ = std::filesystem::file_size(path_, ec);
  if (ec) {
    throw crypto::StreamReadError("Failed to stat " + path_.string() + ": " + ec.message());
  }

  stream_.open(path_, std::ios::binary);
  if (!stream_) {
    throw crypto::StreamReadError("Failed to open " + path_.string());
  }

  BOOST_LOG_TRIVIAL(info) << "File source: Opened " << path_.string() << " (" << size_ << " bytes)";
}

std::string FileSource::name() const {
  return path_.stem().string();
}

std::string FileSource::type() const {
  auto ext = path_.extension().string();
  ext.erase(std::remove(ext.begin(), ext.end(), '.'), ext.end());
  return ext;
}

} // namespace io
} // namespace cirrus
