#ifndef CIRRUS_UPLOAD_ERROR_HPP
#define CIRRUS_UPLOAD_ERROR_HPP

#include <stdexcept>
#include <string>

namespace cirrus {
namespace upload {

// Zero-length sources are rejected before any network call
class EmptySourceError : public std::runtime_error {
public:
    EmptySourceError()
        : std::runtime_error("Source is empty, cannot upload empty files") {}
};

} // namespace upload
} // namespace cirrus

#endif // CIRRUS_UPLOAD_ERROR_HPP
