#ifndef CIRRUS_UPLOAD_INTERRUPT_GUARD_HPP
#define CIRRUS_UPLOAD_INTERRUPT_GUARD_HPP

#include <atomic>
#include <csignal>
#include <functional>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include "network/abort_handle.hpp"

namespace cirrus {
namespace upload {

// Forwards process interrupts to the abort handles registered with it, for as
// long as the guard is alive. Each guard listens on its own signal_set, so
// uploads that never registered with a guard are left untouched. A guard may
// be installed before the upload exists and be handed its handle later.
class InterruptGuard {
public:
  // Called on the guard's thread after the handles were aborted
  using InterruptHandler = std::function<void(int signal_number)>;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit InterruptGuard(std::shared_ptr<network::AbortHandle> handle,
                          InterruptHandler on_interrupt = {},
                          std::initializer_list<int> signals = {SIGINT, SIGTERM});
  ~InterruptGuard();

  InterruptGuard(const InterruptGuard&) = delete;
  InterruptGuard& operator=(const InterruptGuard&) = delete;


  // ---- REGISTRATION ----
  // Null handles are ignored. A handle added after an interrupt is aborted at once.
  void add(std::shared_ptr<network::AbortHandle> handle);


  // ---- GETTERS ----
  bool interrupted() const { return interrupted_.load(); }
  int last_signal() const { return last_signal_.load(); }

private:
  // ---- PARAMETERS ----
  boost::asio::io_context io_context_;
  boost::asio::signal_set signals_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
  std::thread thread_;

  std::mutex mutex_;
  std::vector<std::weak_ptr<network::AbortHandle>> handles_;
  InterruptHandler on_interrupt_;
  std::atomic<bool> interrupted_{false};
  std::atomic<int> last_signal_{0};


  // ---- SIGNAL HANDLING ----
  void async_wait_next();
  void handle_signal(const boost::system::error_code& ec, int signal_number);
};

} // namespace upload
} // namespace cirrus

#endif // CIRRUS_UPLOAD_INTERRUPT_GUARD_HPP
