#ifndef CIRRUS_NETWORK_URL_HPP
#define CIRRUS_NETWORK_URL_HPP

#include <string>

namespace cirrus {
namespace network {

// Absolute http(s) URL split into the parts an HTTP client needs
struct Url {
  std::string scheme;     // "http" or "https"
  std::string host;       // without brackets for IPv6 literals
  std::string port;       // defaults to 80 / 443
  std::string target;     // path and query, at least "/"
  std::string user;       // inline credentials, percent-decoded
  std::string password;

  bool secure() const { return scheme == "https"; }
  bool has_credentials() const { return !user.empty(); }
  // Value for the Host header; the port is omitted when it is the default
  std::string host_header() const;
  // Reassembles the URL without credentials, safe for logging
  std::string redacted() const;

  // Throws std::invalid_argument on anything that is not an absolute http(s) URL
  static Url parse(const std::string& text);
};

} // namespace network
} // namespace cirrus

#endif // CIRRUS_NETWORK_URL_HPP
