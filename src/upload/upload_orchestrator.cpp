#include "upload/upload_orchestrator.hpp"
#include "crypto/content_hash.hpp"
#include "crypto/encoding.hpp"
#include "crypto/key_derivation.hpp"
#include "network/network_error.hpp"
#include "network/transfer_client.hpp"
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace cirrus {
namespace upload {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

UploadOrchestrator::UploadOrchestrator(std::shared_ptr<network::TargetResolver> resolver,
                                       std::shared_ptr<network::Transport> transport)
  : UploadOrchestrator(std::move(resolver), std::move(transport), Options{}) {}

UploadOrchestrator::UploadOrchestrator(std::shared_ptr<network::TargetResolver> resolver,
                                       std::shared_ptr<network::Transport> transport,
                                       Options options)
  : resolver_(std::move(resolver))
  , transport_(std::move(transport))
  , options_(options) {
  if (!resolver_ || !transport_) {
    throw std::invalid_argument("Upload orchestrator: resolver and transport are required");
  }
  BOOST_LOG_TRIVIAL(debug) << "Upload orchestrator: Created";
}

UploadOrchestrator::~UploadOrchestrator() {
  if (!worker_.joinable()) {
    return;
  }

  bool finished;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    finished = state_.is_terminal();
  }
  if (!finished && abort_handle_) {
    BOOST_LOG_TRIVIAL(warning) << "Upload orchestrator: Destroyed while the attempt is running, aborting";
    abort_handle_->abort("Upload orchestrator destroyed");
  }
  worker_.join();
}

//==============================================
// UPLOAD
//==============================================

UploadHandles UploadOrchestrator::upload_from_stream(const UploadTarget& target, std::istream& source,
                                                     std::uint64_t length, UploadOptions options) {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_.get_state() != UploadState::State::IDLE || worker_.joinable()) {
      throw std::logic_error("Upload orchestrator: an orchestrator performs a single attempt");
    }
  }

  abort_handle_ = std::make_shared<network::AbortHandle>();

  std::promise<UploadResult> promise;
  UploadHandles handles;
  handles.result = promise.get_future();
  handles.abort_handle = abort_handle_;

  transition(UploadState::State::PREPARING);
  worker_ = std::thread(&UploadOrchestrator::run, this, target, std::ref(source), length,
                        std::move(options), std::move(promise));

  BOOST_LOG_TRIVIAL(debug) << "Upload orchestrator: Attempt started";
  return handles;
}

UploadState::State UploadOrchestrator::state() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return state_.get_state();
}

//==============================================
// ATTEMPT EXECUTION
//==============================================

void UploadOrchestrator::run(UploadTarget target, std::istream& source, std::uint64_t length,
                             UploadOptions options, std::promise<UploadResult> promise) {
  try {
    UploadResult result = attempt(target, source, length, options);
    transition(UploadState::State::SUCCEEDED);
    promise.set_value(std::move(result));
  }
  catch (const network::TransferAbortedError& e) {
    BOOST_LOG_TRIVIAL(info) << "Upload orchestrator: " << e.what();
    transition(UploadState::State::ABORTED);
    promise.set_exception(std::current_exception());
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Upload orchestrator: Upload failed: " << e.what();
    transition(UploadState::State::FAILED);
    promise.set_exception(std::current_exception());
  }
}

UploadResult UploadOrchestrator::attempt(UploadTarget& target, std::istream& source, std::uint64_t length,
                                         const UploadOptions& options) {
  BOOST_LOG_TRIVIAL(info) << "Upload orchestrator: Preparing upload of " << length << " bytes";

  if (length == 0) {
    BOOST_LOG_TRIVIAL(error) << "Upload orchestrator: Refusing to upload an empty source";
    throw EmptySourceError();
  }

  if (target.index.empty()) {
    target.index = crypto::KeyDerivation::generate_index();
  }

  // Derive first so a bad secret never costs a network round trip
  crypto::ObjectContext context{target.bucket_id, target.index};
  auto key = crypto::KeyDerivation::derive(target.secret, context);

  abort_handle_->throw_if_aborted();
  network::TransferDescriptor descriptor = resolver_->resolve(target.bucket_id, length, *abort_handle_);
  abort_handle_->throw_if_aborted();

  transition(UploadState::State::TRANSFERRING);
  BOOST_LOG_TRIVIAL(info) << "Upload orchestrator: Encrypting and transferring object "
                          << descriptor.remote_object_id;

  crypto::CryptoStream cipher(source, length, key, options_.chunk_size);
  crypto::HashingSource hashed(cipher);
  network::TransferClient client(transport_, options_.weighting);

  UploadResult result;
  result.index = target.index;

  network::TransferOptions transfer_options;
  transfer_options.progress_callback = options.progress_callback;
  transfer_options.abort_handle = abort_handle_;
  transfer_options.finalize = [&](const network::TransferReceipt&) {
    network::CommitRequest commit;
    commit.bucket_id = target.bucket_id;
    commit.index = crypto::to_hex(target.index);
    commit.shard_id = descriptor.remote_object_id;
    commit.content_hash = hashed.digest();
    result.content_hash = commit.content_hash;
    result.remote_object_id = resolver_->commit(commit, *abort_handle_);
  };

  network::TransferReceipt receipt = client.put(descriptor.url, hashed, transfer_options);
  result.fingerprint = receipt.fingerprint;

  BOOST_LOG_TRIVIAL(info) << "Upload orchestrator: Object " << result.remote_object_id
                          << " uploaded with fingerprint " << result.fingerprint;
  return result;
}

void UploadOrchestrator::transition(UploadState::State next) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  auto previous = state_.get_state();
  if (!state_.transition_to(next)) {
    BOOST_LOG_TRIVIAL(error) << "Upload orchestrator: Invalid transition " << previous << " -> " << next;
    throw std::logic_error("Upload orchestrator: invalid state transition to " +
                           UploadState::state_to_string(next));
  }
  BOOST_LOG_TRIVIAL(debug) << "Upload orchestrator: " << previous << " -> " << next;
}

} // namespace upload
} // namespace cirrus
