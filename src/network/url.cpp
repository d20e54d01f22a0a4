#include "network/url.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace cirrus {
namespace network {

namespace {

std::string percent_decode(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '%' && i + 2 < text.size() &&
        std::isxdigit(static_cast<unsigned char>(text[i + 1])) &&
        std::isxdigit(static_cast<unsigned char>(text[i + 2]))) {
      out.push_back(static_cast<char>(std::stoi(text.substr(i + 1, 2), nullptr, 16)));
      i += 2;
    } else {
      out.push_back(text[i]);
    }
  }
  return out;
}

std::string default_port(const std::string& scheme) {
  return scheme == "https" ? "443" : "80";
}

} // namespace

Url Url::parse(const std::string& text) {
  Url url;

  auto scheme_end = text.find("://");
  if (scheme_end == std::string::npos || scheme_end == 0) {
    throw std::invalid_argument("URL has no scheme: " + text);
  }

  url.scheme = text.substr(0, scheme_end);
  std::transform(url.scheme.begin(), url.scheme.end(), url.scheme.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (url.scheme != "http" && url.scheme != "https") {
    throw std::invalid_argument("Unsupported URL scheme: " + url.scheme);
  }

  auto authority_begin = scheme_end + 3;
  auto path_begin = text.find_first_of("/?", authority_begin);
  std::string authority = text.substr(authority_begin, path_begin - authority_begin);
  url.target = path_begin == std::string::npos ? "/" : text.substr(path_begin);
  if (url.target.front() == '?') {
    url.target.insert(url.target.begin(), '/');
  }

  // userinfo@host:port
  auto at = authority.rfind('@');
  if (at != std::string::npos) {
    std::string userinfo = authority.substr(0, at);
    authority = authority.substr(at + 1);
    auto colon = userinfo.find(':');
    url.user = percent_decode(userinfo.substr(0, colon));
    if (colon != std::string::npos) {
      url.password = percent_decode(userinfo.substr(colon + 1));
    }
  }

  std::string port;
  if (!authority.empty() && authority.front() == '[') {
    auto close = authority.find(']');
    if (close == std::string::npos) {
      throw std::invalid_argument("Unterminated IPv6 literal in URL: " + text);
    }
    url.host = authority.substr(1, close - 1);
    if (close + 1 < authority.size()) {
      if (authority[close + 1] != ':') {
        throw std::invalid_argument("Malformed authority in URL: " + text);
      }
      port = authority.substr(close + 2);
    }
  } else {
    auto colon = authority.rfind(':');
    url.host = authority.substr(0, colon);
    if (colon != std::string::npos) {
      port = authority.substr(colon + 1);
    }
  }

  if (url.host.empty()) {
    throw std::invalid_argument("URL has no host: " + text);
  }
  if (!port.empty() && !std::all_of(port.begin(), port.end(),
                                    [](unsigned char c) { return std::isdigit(c); })) {
    throw std::invalid_argument("URL has an invalid port: " + text);
  }
  url.port = port.empty() ? default_port(url.scheme) : port;

  return url;
}

std::string Url::host_header() const {
  std::string host_part = host.find(':') != std::string::npos ? "[" + host + "]" : host;
  if (port == default_port(scheme)) {
    return host_part;
  }
  return host_part + ":" + port;
}

std::string Url::redacted() const {
  return scheme + "://" + host_header() + target;
}

} // namespace network
} // namespace cirrus
