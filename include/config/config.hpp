#ifndef CIRRUS_CONFIG_HPP
#define CIRRUS_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include "logger/logger.hpp"

namespace cirrus::config {

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& message)
    : std::runtime_error("Configuration error: " + message) {}
};

// Runtime settings, read from CIRRUS_* environment variables
struct Config {
  std::string network_url = "https://gateway.internxt.com/network";
  std::string drive_api_url = "https://drive.internxt.com/api";
  std::string drive_url = "https://drive.internxt.com";
  unsigned transfer_weight = 90;
  std::filesystem::path credentials_path;
  std::string log_file = "cirrus.log";
  logging::severity_level log_level = logging::severity_level::info;
  std::size_t chunk_size = 64 * 1024;
  std::chrono::seconds timeout{60};

  using Lookup = std::function<std::optional<std::string>(const std::string& name)>;

  // Reads the process environment
  static Config from_environment();
  // Reads variables through lookup; unset variables keep their defaults
  static Config from_lookup(const Lookup& lookup);
};

} // namespace cirrus::config

#endif // CIRRUS_CONFIG_HPP
