#include "io/byte_source.hpp"
#include "crypto/crypto_error.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace cirrus {
namespace io {

IstreamSource::IstreamSource(std::istream& input, std::uint64_t length)
  : input_(input)
  , length_(length) {}

std::size_t IstreamSource::read(uint8_t* out, std::size_t max) {
  if (consumed_ >= length_ || max == 0) {
    return 0;
  }

  auto wanted = static_cast<std::size_t>(std::min<std::uint64_t>(max, length_ - consumed_));
  input_.read(reinterpret_cast<char*>(out), static_cast<std::streamsize>(wanted));
  auto got = static_cast<std::size_t>(input_.gcount());

  if (got == 0) {
    BOOST_LOG_TRIVIAL(error) << "Byte source: Stream ended after " << consumed_
                             << " of " << length_ << " bytes";
    throw crypto::StreamReadError("Source ended before its declared length");
  }

  consumed_ += got;
  return got;
}

} // namespace io
} // namespace cirrus
