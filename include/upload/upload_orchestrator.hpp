#ifndef CIRRUS_UPLOAD_ORCHESTRATOR_HPP
#define CIRRUS_UPLOAD_ORCHESTRATOR_HPP

#include <cstdint>
#include <future>
#include <istream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "crypto/crypto_stream.hpp"
#include "network/abort_handle.hpp"
#include "network/progress.hpp"
#include "network/target_resolver.hpp"
#include "network/transport.hpp"
#include "upload/upload_error.hpp"
#include "upload/upload_state.hpp"

namespace cirrus {
namespace upload {

// Account side context of an upload
struct UploadTarget {
  std::string bucket_id;
  std::string secret;             // shared secret the object key is derived from
  std::vector<uint8_t> index;     // generated per attempt when left empty
};

struct UploadOptions {
  network::ProgressCallback progress_callback;
};

struct UploadResult {
  std::string remote_object_id;   // file id the storage network committed
  std::string fingerprint;
  std::string content_hash;
  std::vector<uint8_t> index;     // needed later to derive the object key again
};

struct UploadHandles {
  std::future<UploadResult> result;
  std::shared_ptr<network::AbortHandle> abort_handle;
};

// Runs exactly one encrypted upload attempt:
//   resolve target -> encrypt and hash on the fly -> PUT -> fingerprint -> commit.
// The attempt runs on a worker thread owned by the orchestrator. A failed or
// aborted attempt cannot be resumed because the cipher state has moved on;
// retrying means constructing a new orchestrator.
class UploadOrchestrator {
public:
  struct Options {
    network::ProgressWeighting weighting{};
    std::size_t chunk_size = crypto::CryptoStream::DEFAULT_CHUNK_SIZE;
  };

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  UploadOrchestrator(std::shared_ptr<network::TargetResolver> resolver,
                     std::shared_ptr<network::Transport> transport);
  UploadOrchestrator(std::shared_ptr<network::TargetResolver> resolver,
                     std::shared_ptr<network::Transport> transport,
                     Options options);
  // Aborts a still running attempt and waits for the worker
  ~UploadOrchestrator();

  UploadOrchestrator(const UploadOrchestrator&) = delete;
  UploadOrchestrator& operator=(const UploadOrchestrator&) = delete;


  // ---- UPLOAD ----
  // Starts the attempt and returns at once. source must stay alive until the
  // result future is ready. Throws std::logic_error on a second call.
  UploadHandles upload_from_stream(const UploadTarget& target, std::istream& source,
                                   std::uint64_t length, UploadOptions options);


  // ---- GETTERS ----
  UploadState::State state() const;

private:
  // ---- PARAMETERS ----
  std::shared_ptr<network::TargetResolver> resolver_;
  std::shared_ptr<network::Transport> transport_;
  Options options_;

  mutable std::mutex state_mutex_;
  UploadState state_;
  std::shared_ptr<network::AbortHandle> abort_handle_;
  std::thread worker_;


  // ---- ATTEMPT EXECUTION ----
  // Worker entry point; settles the promise exactly once
  void run(UploadTarget target, std::istream& source, std::uint64_t length,
           UploadOptions options, std::promise<UploadResult> promise);
  UploadResult attempt(UploadTarget& target, std::istream& source, std::uint64_t length,
                       const UploadOptions& options);
  void transition(UploadState::State next);
};

} // namespace upload
} // namespace cirrus

#endif // CIRRUS_UPLOAD_ORCHESTRATOR_HPP
