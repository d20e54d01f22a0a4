#include "config/config.hpp"
#include <cstdlib>

namespace cirrus::config {

namespace {

unsigned long parse_number(const std::string& name, const std::string& value,
                           unsigned long min, unsigned long max) {
  std::size_t consumed = 0;
  unsigned long number = 0;
  try {
    number = std::stoul(value, &consumed);
  } catch (const std::exception&) {
    throw ConfigError(name + " is not a number: " + value);
  }
  if (consumed != value.size() || value.front() == '-') {
    throw ConfigError(name + " is not a number: " + value);
  }
  if (number < min || number > max) {
    throw ConfigError(name + " must be within " + std::to_string(min) + ".." +
                      std::to_string(max) + ", got " + value);
  }
  return number;
}

std::string strip_trailing_slash(std::string url) {
  while (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  return url;
}

std::filesystem::path default_credentials_path(const Config::Lookup& lookup) {
  auto home = lookup("HOME");
  std::filesystem::path base = home ? std::filesystem::path(*home) : std::filesystem::current_path();
  return base / ".cirrus" / "credentials.json";
}

} // namespace

Config Config::from_environment() {
  return from_lookup([](const std::string& name) -> std::optional<std::string> {
    const char* value = std::getenv(name.c_str());
    if (!value || !*value) {
      return std::nullopt;
    }
    return std::string(value);
  });
}

Config Config::from_lookup(const Lookup& lookup) {
  Config config;

  if (auto v = lookup("CIRRUS_NETWORK_URL")) config.network_url = strip_trailing_slash(*v);
  if (auto v = lookup("CIRRUS_DRIVE_API_URL")) config.drive_api_url = strip_trailing_slash(*v);
  if (auto v = lookup("CIRRUS_DRIVE_URL")) config.drive_url = strip_trailing_slash(*v);

  if (auto v = lookup("CIRRUS_TRANSFER_WEIGHT")) {
    config.transfer_weight = static_cast<unsigned>(parse_number("CIRRUS_TRANSFER_WEIGHT", *v, 1, 99));
  }
  if (auto v = lookup("CIRRUS_CHUNK_SIZE")) {
    config.chunk_size = parse_number("CIRRUS_CHUNK_SIZE", *v, 1, 64ul * 1024 * 1024);
  }
  if (auto v = lookup("CIRRUS_TIMEOUT")) {
    config.timeout = std::chrono::seconds(parse_number("CIRRUS_TIMEOUT", *v, 1, 24 * 3600));
  }

  config.credentials_path = default_credentials_path(lookup);
  if (auto v = lookup("CIRRUS_CREDENTIALS")) config.credentials_path = *v;
  if (auto v = lookup("CIRRUS_LOG_FILE")) config.log_file = *v;

  if (auto v = lookup("CIRRUS_LOG_LEVEL")) {
    try {
      config.log_level = logging::parse_severity(*v);
    } catch (const std::invalid_argument& e) {
      throw ConfigError(e.what());
    }
  }

  return config;
}

} // namespace cirrus::config
