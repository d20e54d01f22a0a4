#ifndef CIRRUS_NETWORK_PROGRESS_HPP
#define CIRRUS_NETWORK_PROGRESS_HPP

#include <cstdint>
#include <functional>
#include <optional>

namespace cirrus {
namespace network {

class AbortHandle;

using ProgressCallback = std::function<void(unsigned percentage)>;

// Phases of one upload as seen by the progress sink. Transfer covers
// [0, transfer_weight], Finalize covers the rest up to 100.
enum class Phase {
  Transfer,
  Finalize
};

// Maps a phase-local completion fraction onto the overall 0-100 scale
class ProgressWeighting {
public:
  static constexpr unsigned DEFAULT_TRANSFER_WEIGHT = 90;
  static constexpr unsigned COMPLETE = 100;

  // Throws std::invalid_argument unless 1 <= transfer_weight <= 99. The
  // finalize phase always keeps a share so 100 is only reached on completion.
  explicit ProgressWeighting(unsigned transfer_weight = DEFAULT_TRANSFER_WEIGHT);

  // fraction is clamped to [0, 1]
  unsigned percentage(Phase phase, double fraction) const;
  // floor(sent / total * transfer_weight) in integer arithmetic
  unsigned transfer_percentage(std::uint64_t sent, std::uint64_t total) const;

  unsigned transfer_weight() const { return transfer_weight_; }

private:
  unsigned transfer_weight_;
};

// Forwards percentages to the caller's callback, one call per report, while
// enforcing ordering. A value below the last one is dropped, an equal value is
// passed on again. Nothing is emitted once the tracker is closed or the abort
// handle has fired.
class ProgressTracker {
public:
  explicit ProgressTracker(ProgressCallback callback, const AbortHandle* abort_handle = nullptr);

  // Returns true if the callback was invoked
  bool report(unsigned percentage);
  // Stops all further reports
  void close() { closed_ = true; }

  std::optional<unsigned> last() const { return last_; }
  bool closed() const { return closed_; }

private:
  ProgressCallback callback_;
  const AbortHandle* abort_handle_;
  std::optional<unsigned> last_;
  bool closed_ = false;
};

} // namespace network
} // namespace cirrus

#endif // CIRRUS_NETWORK_PROGRESS_HPP
