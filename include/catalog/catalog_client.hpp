#ifndef CIRRUS_CATALOG_CLIENT_HPP
#define CIRRUS_CATALOG_CLIENT_HPP

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include "network/transport.hpp"

namespace cirrus {
namespace catalog {

// The object is stored but the catalog refused or failed to record it
class RegistrationError : public std::runtime_error {
public:
  explicit RegistrationError(const std::string& message, unsigned status = 0)
    : std::runtime_error("Upload succeeded but registration failed: " + message)
    , status_(status) {}

  unsigned status() const { return status_; }

private:
  unsigned status_;
};

struct FileEntry {
  std::string name;               // without extension
  std::string type;               // extension without dots
  std::uint64_t size = 0;
  std::string folder_id;
  std::string remote_object_id;
  std::string bucket_id;
  std::string fingerprint;
};

struct CatalogRecord {
  std::string uuid;
  std::string id;
};

class Catalog {
public:
  virtual ~Catalog() = default;

  // Throws RegistrationError
  virtual CatalogRecord register_file(const FileEntry& entry) = 0;

protected:
  Catalog() = default;
};

// Registers files through the drive API: POST {api_url}/storage/file
class DriveCatalogClient : public Catalog {
public:
  DriveCatalogClient(std::shared_ptr<network::Transport> transport, std::string api_url, std::string token);

  CatalogRecord register_file(const FileEntry& entry) override;

  // JSON body sent for entry
  static std::string request_body(const FileEntry& entry);

private:
  std::shared_ptr<network::Transport> transport_;
  std::string api_url_;
  std::string token_;
};

} // namespace catalog
} // namespace cirrus

#endif // CIRRUS_CATALOG_CLIENT_HPP
