#ifndef CIRRUS_NETWORK_TRANSFER_CLIENT_HPP
#define CIRRUS_NETWORK_TRANSFER_CLIENT_HPP

#include <functional>
#include <memory>
#include <string>
#include "io/byte_source.hpp"
#include "network/abort_handle.hpp"
#include "network/progress.hpp"
#include "network/transport.hpp"

namespace cirrus {
namespace network {

// Server acknowledgement of a completed PUT
struct TransferReceipt {
  std::string fingerprint;
  unsigned status = 0;
};

struct TransferOptions {
  ProgressCallback progress_callback;
  // Optional; a private handle is used when none is given
  std::shared_ptr<AbortHandle> abort_handle;
  // Runs after the ETag was accepted and before progress reaches 100. Anything
  // it throws fails the transfer.
  std::function<void(const TransferReceipt&)> finalize;
};

// Uploads one byte stream with a single PUT and turns the endpoint's answer
// into a fingerprint. Progress runs from 0 to the transfer weight while bytes
// are sent and jumps to 100 once a non-empty ETag came back and the optional
// finalize step succeeded.
class TransferClient {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit TransferClient(std::shared_ptr<Transport> transport,
                          ProgressWeighting weighting = ProgressWeighting{});


  // ---- TRANSFER ----
  // Throws MissingFingerprintError, TransferAbortedError or TransferError
  TransferReceipt put(const std::string& url, io::ByteSource& body, const TransferOptions& options);

  const ProgressWeighting& weighting() const { return weighting_; }

private:
  // ---- PARAMETERS ----
  std::shared_ptr<Transport> transport_;
  ProgressWeighting weighting_;
};

} // namespace network
} // namespace cirrus

#endif // CIRRUS_NETWORK_TRANSFER_CLIENT_HPP
