#include "network/transfer_client.hpp"
#include "network/network_error.hpp"
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace cirrus {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TransferClient::TransferClient(std::shared_ptr<Transport> transport, ProgressWeighting weighting)
  : transport_(std::move(transport))
  , weighting_(weighting) {
  if (!transport_) {
    throw std::invalid_argument("Transfer client: transport is required");
  }
  BOOST_LOG_TRIVIAL(debug) << "Transfer client: Created with transfer weight " << weighting_.transfer_weight();
}

//==============================================
// TRANSFER
//==============================================

TransferReceipt TransferClient::put(const std::string& url, io::ByteSource& body, const TransferOptions& options) {
  auto abort_handle = options.abort_handle ? options.abort_handle : std::make_shared<AbortHandle>();
  ProgressTracker tracker(options.progress_callback, abort_handle.get());

  abort_handle->throw_if_aborted();
  BOOST_LOG_TRIVIAL(info) << "Transfer client: Starting upload of " << body.size() << " bytes";

  HttpResponse response = transport_->put_stream(url, body,
    [this, &tracker](std::uint64_t sent, std::uint64_t total) {
      tracker.report(weighting_.transfer_percentage(sent, total));
    },
    *abort_handle);

  // A response that raced with the abort is still an abort
  if (abort_handle->aborted()) {
    BOOST_LOG_TRIVIAL(info) << "Transfer client: Discarding response received after abort";
    throw TransferAbortedError(abort_handle->reason());
  }

  if (!response.ok()) {
    BOOST_LOG_TRIVIAL(error) << "Transfer client: Endpoint rejected upload with status " << response.status;
    throw TransferError("endpoint responded with HTTP status " + std::to_string(response.status),
                        response.status);
  }

  auto etag = response.header("etag");
  if (!etag || etag->empty()) {
    BOOST_LOG_TRIVIAL(error) << "Transfer client: Response carries no ETag";
    throw MissingFingerprintError();
  }

  BOOST_LOG_TRIVIAL(info) << "Transfer client: Upload acknowledged with ETag " << *etag;

  TransferReceipt receipt;
  receipt.fingerprint = *etag;
  receipt.status = response.status;

  if (options.finalize) {
    options.finalize(receipt);
    abort_handle->throw_if_aborted();
  }

  tracker.report(weighting_.percentage(Phase::Finalize, 1.0));
  return receipt;
}

} // namespace network
} // namespace cirrus
