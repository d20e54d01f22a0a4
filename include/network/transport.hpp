#ifndef CIRRUS_NETWORK_TRANSPORT_HPP
#define CIRRUS_NETWORK_TRANSPORT_HPP

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include "io/byte_source.hpp"
#include "network/abort_handle.hpp"

namespace cirrus {
namespace network {

struct HttpRequest {
  std::string method = "GET";
  std::string url;
  std::map<std::string, std::string> headers;
  std::string body;
};

struct HttpResponse {
  unsigned status = 0;
  std::map<std::string, std::string> headers;   // names lowercased
  std::string body;

  bool ok() const { return status >= 200 && status < 300; }
  // Case-insensitive lookup
  std::optional<std::string> header(const std::string& name) const;
};

// Invoked after each body write with cumulative and total byte counts
using TransportProgress = std::function<void(std::uint64_t sent, std::uint64_t total)>;

// HTTP seam between the upload pipeline and the wire. Implementations report
// connection level faults as TransferError and cancellation as
// TransferAbortedError; any HTTP status is returned to the caller as is.
class Transport {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  virtual ~Transport() = default;


  // ---- REQUESTS ----
  // Sends a request with a small in-memory body and returns the full response.
  // When abort_handle is given, firing it cancels the exchange at any stage.
  virtual HttpResponse send(const HttpRequest& request, AbortHandle* abort_handle = nullptr) = 0;
  // PUTs body to url without buffering it, calling on_progress as bytes leave
  virtual HttpResponse put_stream(const std::string& url, io::ByteSource& body,
                                  const TransportProgress& on_progress,
                                  AbortHandle& abort_handle) = 0;

protected:
  Transport() = default;
};

} // namespace network
} // namespace cirrus

#endif // CIRRUS_NETWORK_TRANSPORT_HPP
