#include "network/abort_handle.hpp"
#include "network/network_error.hpp"
#include <boost/log/trivial.hpp>

namespace cirrus {
namespace network {

//==============================================
// SCOPED LISTENER
//==============================================

AbortHandle::ScopedListener::ScopedListener(AbortHandle& handle, Listener listener)
  : handle_(handle)
  , id_(handle.add_listener(std::move(listener))) {}

AbortHandle::ScopedListener::~ScopedListener() {
  handle_.remove_listener(id_);
}

//==============================================
// CANCELLATION
//==============================================

bool AbortHandle::abort(const std::string& reason) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (aborted_) {
    BOOST_LOG_TRIVIAL(debug) << "Abort handle: Already aborted, ignoring: " << reason;
    return false;
  }

  reason_ = reason;
  aborted_ = true;
  BOOST_LOG_TRIVIAL(info) << "Abort handle: Aborting: " << reason
                          << " (" << listeners_.size() << " listeners)";

  for (auto& entry : listeners_) {
    try {
      entry.second(reason_);
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Abort handle: Listener " << entry.first << " failed: " << e.what();
    }
  }
  return true;
}

std::string AbortHandle::reason() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return reason_;
}

void AbortHandle::throw_if_aborted() const {
  if (aborted_) {
    throw TransferAbortedError(reason());
  }
}

//==============================================
// LISTENERS
//==============================================

AbortHandle::ListenerId AbortHandle::add_listener(Listener listener) {
  std::lock_guard<std::mutex> lock(mutex_);

  ListenerId id = next_id_++;
  if (aborted_) {
    listener(reason_);
  }
  listeners_.emplace(id, std::move(listener));
  return id;
}

void AbortHandle::remove_listener(ListenerId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  listeners_.erase(id);
}

} // namespace network
} // namespace cirrus
