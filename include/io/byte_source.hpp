#ifndef CIRRUS_IO_BYTE_SOURCE_HPP
#define CIRRUS_IO_BYTE_SOURCE_HPP

#include <cstddef>
#include <cstdint>
#include <istream>

namespace cirrus {
namespace io {

// Forward-only pull source of a known number of bytes
class ByteSource {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    virtual ~ByteSource() = default;


    // ---- READ OPERATIONS ----
    // Reads up to max bytes into out; returns 0 only once the source is exhausted
    virtual std::size_t read(uint8_t* out, std::size_t max) = 0;
    // Total number of bytes the source yields
    virtual std::uint64_t size() const = 0;

protected:
    ByteSource() = default;
};

// Exposes an istream of declared length as a ByteSource
class IstreamSource : public ByteSource {
public:
    IstreamSource(std::istream& input, std::uint64_t length);

    std::size_t read(uint8_t* out, std::size_t max) override;
    std::uint64_t size() const override { return length_; }

private:
    std::istream& input_;
    std::uint64_t length_;
    std::uint64_t consumed_{0};
};

} // namespace io
} // namespace cirrus

#endif // CIRRUS_IO_BYTE_SOURCE_HPP
