#include "network/progress.hpp"
#include "network/abort_handle.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <boost/log/trivial.hpp>

namespace cirrus {
namespace network {

//==============================================
// WEIGHTING
//==============================================

ProgressWeighting::ProgressWeighting(unsigned transfer_weight)
  : transfer_weight_(transfer_weight) {
  if (transfer_weight_ == 0 || transfer_weight_ >= COMPLETE) {
    throw std::invalid_argument("Transfer weight must be within 1..99, got " +
                                std::to_string(transfer_weight_));
  }
}

unsigned ProgressWeighting::percentage(Phase phase, double fraction) const {
  fraction = std::clamp(fraction, 0.0, 1.0);

  // Small bias so that e.g. 0.29 * 100 lands on 29 and not 28.999...
  constexpr double epsilon = 1e-9;

  switch (phase) {
    case Phase::Transfer:
      return static_cast<unsigned>(std::floor(fraction * transfer_weight_ + epsilon));
    case Phase::Finalize:
      return transfer_weight_ +
             static_cast<unsigned>(std::floor(fraction * (COMPLETE - transfer_weight_) + epsilon));
  }
  return 0;
}

unsigned ProgressWeighting::transfer_percentage(std::uint64_t sent, std::uint64_t total) const {
  if (total == 0) {
    return 0;
  }
  sent = std::min(sent, total);
  return static_cast<unsigned>((sent * transfer_weight_) / total);
}

//==============================================
// TRACKER
//==============================================

ProgressTracker::ProgressTracker(ProgressCallback callback, const AbortHandle* abort_handle)
  : callback_(std::move(callback))
  , abort_handle_(abort_handle) {}

bool ProgressTracker::report(unsigned percentage) {
  if (closed_ || (abort_handle_ && abort_handle_->aborted())) {
    return false;
  }

  percentage = std::min(percentage, ProgressWeighting::COMPLETE);
  if (last_ && percentage < *last_) {
    return false;
  }

  last_ = percentage;
  BOOST_LOG_TRIVIAL(trace) << "Progress: " << percentage << "%";
  if (callback_) {
    callback_(percentage);
  }
  return true;
}

} // namespace network
} // namespace cirrus
