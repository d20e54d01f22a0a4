#ifndef CIRRUS_IO_FILE_SOURCE_HPP
#define CIRRUS_IO_FILE_SOURCE_HPP

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

namespace cirrus {
namespace io {

// A local file opened for a single forward read, with its exact size
class FileSource {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit FileSource(const std::filesystem::path& path);

  FileSource(const FileSource&) = delete;
  FileSource& operator=(const FileSource&) = delete;


  // ---- GETTERS ----
  std::istream& stream() { return stream_; }
  std::uint64_t size() const { return size_; }
  const std::filesystem::path& path() const { return path_; }
  // File name without directory or extension
  std::string name() const;
  // Extension with every '.' removed ("archive.tar.gz" -> "gz")
  std::string type() const;

private:
  // ---- PARAMETERS ----
  std::filesystem::path path_;
  std::uint64_t size_;
  std::ifstream stream_;
};

} // namespace io
} // namespace cirrus

#endif // CIRRUS_IO_FILE_SOURCE_HPP
