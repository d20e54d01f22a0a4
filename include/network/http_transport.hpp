#ifndef CIRRUS_NETWORK_HTTP_TRANSPORT_HPP
#define CIRRUS_NETWORK_HTTP_TRANSPORT_HPP

#include <chrono>
#include <cstddef>
#include <string>
#include "network/transport.hpp"

namespace cirrus {
namespace network {

// Boost.Beast implementation of Transport over plain TCP or TLS. Every call
// runs on its own io_context on the calling thread, so one instance can serve
// concurrent uploads without sharing socket state.
class HttpTransport : public Transport {
public:
  struct Options {
    std::chrono::seconds timeout{60};     // per I/O operation
    std::size_t chunk_size = 64 * 1024;   // bytes pulled from the body per write
    bool verify_peer = true;
    std::string user_agent = "cirrus-upload/1.0";
  };

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  HttpTransport();
  explicit HttpTransport(Options options);
  ~HttpTransport() override = default;


  // ---- REQUESTS ----
  HttpResponse send(const HttpRequest& request, AbortHandle* abort_handle = nullptr) override;
  HttpResponse put_stream(const std::string& url, io::ByteSource& body,
                          const TransportProgress& on_progress,
                          AbortHandle& abort_handle) override;

  const Options& options() const { return options_; }

private:
  Options options_;
};

} // namespace network
} // namespace cirrus

#endif // CIRRUS_NETWORK_HTTP_TRANSPORT_HPP
