#include "network/http_transport.hpp"
#include "network/network_error.hpp"
#include "network/url.hpp"
#include "crypto/encoding.hpp"
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <cctype>
#include <optional>
#include <type_traits>
#include <vector>

namespace cirrus {
namespace network {

namespace {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

template <class Stream>
struct is_tls : std::false_type {};

template <class Next>
struct is_tls<beast::ssl_stream<Next>> : std::true_type {};

std::string lowercase(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

std::string basic_authorization(const Url& url) {
  return "Basic " + crypto::base64_encode(url.user + ":" + url.password);
}

//==============================================
// SINGLE OPERATION DRIVER
//==============================================

// Runs one asynchronous operation at a time on the call's private io_context.
// Between operations the abort handle is checked, and an abort that lands
// during an operation closes the socket so the operation completes early.
template <class Stream>
class Exchange {
public:
  Exchange(asio::io_context& ioc, Stream& stream, std::chrono::seconds timeout, const AbortHandle* abort_handle)
    : ioc_(ioc)
    , stream_(stream)
    , timeout_(timeout)
    , abort_handle_(abort_handle) {}

  template <class Initiate>
  void run(const std::string& what, Initiate&& initiate) {
    if (abort_handle_) {
      abort_handle_->throw_if_aborted();
    }

    beast::get_lowest_layer(stream_).expires_after(timeout_);

    boost::system::error_code result = asio::error::would_block;
    initiate([&result](boost::system::error_code ec, auto&&...) { result = ec; });

    ioc_.restart();
    ioc_.run();

    // Cancellation wins over whatever the operation produced
    if (abort_handle_ && abort_handle_->aborted()) {
      BOOST_LOG_TRIVIAL(info) << "HTTP transport: " << what << " interrupted by abort";
      throw TransferAbortedError(abort_handle_->reason());
    }

    if (result == http::error::need_buffer) {
      result = {};
    }
    if (result) {
      BOOST_LOG_TRIVIAL(error) << "HTTP transport: " << what << " failed: " << result.message();
      throw TransferError(what + ": " + result.message());
    }
  }

private:
  asio::io_context& ioc_;
  Stream& stream_;
  std::chrono::seconds timeout_;
  const AbortHandle* abort_handle_;
};

template <class Stream>
void close_stream(Stream& stream) {
  auto& lowest = beast::get_lowest_layer(stream);
  boost::system::error_code ec;
  lowest.socket().shutdown(tcp::socket::shutdown_both, ec);
  if (ec && ec != beast::errc::not_connected) {
    BOOST_LOG_TRIVIAL(debug) << "HTTP transport: Shutdown reported: " << ec.message();
  }
  lowest.close();
}

HttpResponse to_response(const http::response<http::string_body>& res) {
  HttpResponse out;
  out.status = res.result_int();
  for (const auto& field : res) {
    auto name = field.name_string();
    auto value = field.value();
    out.headers[lowercase(std::string(name.data(), name.size()))] = std::string(value.data(), value.size());
  }
  out.body = res.body();
  return out;
}

//==============================================
// CONNECTION LIFECYCLE
//==============================================

// Connects, lets writer send the request, then reads the response
template <class Stream, class Writer>
HttpResponse perform(asio::io_context& ioc, Stream& stream, const Url& url,
                     const HttpTransport::Options& options, AbortHandle* abort_handle,
                     Writer& writer) {
  auto& lowest = beast::get_lowest_layer(stream);
  Exchange<Stream> exchange(ioc, stream, options.timeout, abort_handle);

  // Closing the socket from inside the io_context makes any pending write or
  // read complete with an error, and tells the peer the upload was abandoned
  std::optional<AbortHandle::ScopedListener> on_abort;
  if (abort_handle) {
    on_abort.emplace(*abort_handle, [&ioc, &lowest](const std::string&) {
      asio::post(ioc, [&lowest]() {
        BOOST_LOG_TRIVIAL(debug) << "HTTP transport: Closing connection after abort";
        boost::system::error_code ec;
        lowest.socket().shutdown(tcp::socket::shutdown_both, ec);
        lowest.close();
      });
    });
  }

  tcp::resolver resolver(ioc);
  tcp::resolver::results_type endpoints;
  exchange.run("resolve " + url.host, [&](auto handler) {
    resolver.async_resolve(url.host, url.port,
      [&endpoints, handler](boost::system::error_code ec, tcp::resolver::results_type results) mutable {
        endpoints = results;
        handler(ec);
      });
  });

  exchange.run("connect to " + url.host_header(), [&](auto handler) {
    lowest.async_connect(endpoints, handler);
  });

  if constexpr (is_tls<Stream>::value) {
    exchange.run("TLS handshake", [&](auto handler) {
      stream.async_handshake(asio::ssl::stream_base::client, handler);
    });
  }

  writer(stream, exchange);

  beast::flat_buffer buffer;
  http::response<http::string_body> res;
  exchange.run("read response", [&](auto handler) {
    http::async_read(stream, buffer, res, handler);
  });

  close_stream(stream);
  BOOST_LOG_TRIVIAL(debug) << "HTTP transport: Response " << res.result_int() << " from " << url.redacted();
  return to_response(res);
}

template <class Writer>
HttpResponse run_request(const Url& url, const HttpTransport::Options& options,
                         AbortHandle* abort_handle, Writer writer) {
  asio::io_context ioc;

  if (url.secure()) {
    asio::ssl::context ssl_ctx(asio::ssl::context::tls_client);
    ssl_ctx.set_default_verify_paths();
    ssl_ctx.set_verify_mode(options.verify_peer ? asio::ssl::verify_peer : asio::ssl::verify_none);

    beast::ssl_stream<beast::tcp_stream> stream(ioc, ssl_ctx);
    if (options.verify_peer) {
      stream.set_verify_callback(asio::ssl::host_name_verification(url.host));
    }
    if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
      throw TransferError("Failed to set TLS server name for " + url.host);
    }
    return perform(ioc, stream, url, options, abort_handle, writer);
  }

  beast::tcp_stream stream(ioc);
  return perform(ioc, stream, url, options, abort_handle, writer);
}

Url parse_url(const std::string& text) {
  try {
    return Url::parse(text);
  } catch (const std::invalid_argument& e) {
    BOOST_LOG_TRIVIAL(error) << "HTTP transport: " << e.what();
    throw TransferError(e.what());
  }
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

HttpTransport::HttpTransport()
  : HttpTransport(Options{}) {}

HttpTransport::HttpTransport(Options options)
  : options_(std::move(options)) {
  if (options_.chunk_size == 0) {
    throw std::invalid_argument("HTTP transport: chunk size must be positive");
  }
}

//==============================================
// REQUESTS
//==============================================

HttpResponse HttpTransport::send(const HttpRequest& request, AbortHandle* abort_handle) {
  Url url = parse_url(request.url);
  BOOST_LOG_TRIVIAL(debug) << "HTTP transport: " << request.method << " " << url.redacted();

  http::verb verb = http::string_to_verb(request.method);
  if (verb == http::verb::unknown) {
    throw TransferError("Unsupported HTTP method: " + request.method);
  }

  auto writer = [&](auto& stream, auto& exchange) {
    http::request<http::string_body> req{verb, url.target, 11};
    req.set(http::field::host, url.host_header());
    req.set(http::field::user_agent, options_.user_agent);
    if (url.has_credentials()) {
      req.set(http::field::authorization, basic_authorization(url));
    }
    for (const auto& header : request.headers) {
      req.set(header.first, header.second);
    }
    req.body() = request.body;
    req.prepare_payload();

    exchange.run("write request", [&](auto handler) {
      http::async_write(stream, req, handler);
    });
  };

  try {
    return run_request(url, options_, abort_handle, writer);
  } catch (const boost::system::system_error& e) {
    BOOST_LOG_TRIVIAL(error) << "HTTP transport: " << e.what();
    throw TransferError(e.what());
  }
}

HttpResponse HttpTransport::put_stream(const std::string& target_url, io::ByteSource& body,
                                       const TransportProgress& on_progress,
                                       AbortHandle& abort_handle) {
  Url url = parse_url(target_url);
  const std::uint64_t total = body.size();
  BOOST_LOG_TRIVIAL(info) << "HTTP transport: PUT " << total << " bytes to " << url.redacted();

  auto writer = [&](auto& stream, auto& exchange) {
    http::request<http::buffer_body> req{http::verb::put, url.target, 11};
    req.set(http::field::host, url.host_header());
    req.set(http::field::user_agent, options_.user_agent);
    req.set(http::field::content_type, "application/octet-stream");
    if (url.has_credentials()) {
      req.set(http::field::authorization, basic_authorization(url));
    }
    req.content_length(total);
    req.body().data = nullptr;
    req.body().more = true;

    http::request_serializer<http::buffer_body> serializer{req};
    exchange.run("write header", [&](auto handler) {
      http::async_write_header(stream, serializer, handler);
    });

    std::vector<uint8_t> chunk(options_.chunk_size);
    std::uint64_t sent = 0;
    while (true) {
      abort_handle.throw_if_aborted();

      auto n = body.read(chunk.data(), chunk.size());
      if (n == 0) {
        break;
      }

      req.body().data = chunk.data();
      req.body().size = n;
      req.body().more = true;
      exchange.run("write body", [&](auto handler) {
        http::async_write(stream, serializer, handler);
      });

      sent += n;
      BOOST_LOG_TRIVIAL(trace) << "HTTP transport: Sent " << sent << " of " << total << " bytes";
      if (on_progress) {
        on_progress(sent, total);
      }
    }

    if (sent != total) {
      throw TransferError("Body produced " + std::to_string(sent) + " of " +
                          std::to_string(total) + " declared bytes");
    }

    req.body().data = nullptr;
    req.body().size = 0;
    req.body().more = false;
    exchange.run("finish body", [&](auto handler) {
      http::async_write(stream, serializer, handler);
    });
  };

  try {
    return run_request(url, options_, &abort_handle, writer);
  } catch (const boost::system::system_error& e) {
    BOOST_LOG_TRIVIAL(error) << "HTTP transport: " << e.what();
    throw TransferError(e.what());
  }
}

} // namespace network
} // namespace cirrus
