#include "upload/interrupt_guard.hpp"
#include <boost/log/trivial.hpp>
#include <string>

namespace cirrus {
namespace upload {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

InterruptGuard::InterruptGuard(std::shared_ptr<network::AbortHandle> handle,
                               InterruptHandler on_interrupt,
                               std::initializer_list<int> signals)
  : signals_(io_context_)
  , work_(boost::asio::make_work_guard(io_context_))
  , on_interrupt_(std::move(on_interrupt)) {
  for (int signal_number : signals) {
    signals_.add(signal_number);
  }
  add(std::move(handle));

  async_wait_next();
  thread_ = std::thread([this]() {
    try {
      io_context_.run();
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Interrupt guard: Signal loop error: " << e.what();
    }
  });

  BOOST_LOG_TRIVIAL(debug) << "Interrupt guard: Installed";
}

InterruptGuard::~InterruptGuard() {
  // signal_set is not thread safe, so it is cancelled from its own loop
  boost::asio::post(io_context_, [this]() {
    boost::system::error_code ec;
    signals_.cancel(ec);
    signals_.clear(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(warning) << "Interrupt guard: Failed to release signals: " << ec.message();
    }
  });
  work_.reset();

  if (thread_.joinable()) {
    thread_.join();
  }
  BOOST_LOG_TRIVIAL(debug) << "Interrupt guard: Released";
}

//==============================================
// REGISTRATION
//==============================================

void InterruptGuard::add(std::shared_ptr<network::AbortHandle> handle) {
  if (!handle) {
    return;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    handles_.push_back(handle);
  }

  // A signal that arrived before registration still cancels the upload
  if (interrupted_) {
    BOOST_LOG_TRIVIAL(info) << "Interrupt guard: Handle registered after an interrupt, aborting it";
    handle->abort("Interrupted by signal " + std::to_string(last_signal_.load()));
  }
}

//==============================================
// SIGNAL HANDLING
//==============================================

void InterruptGuard::async_wait_next() {
  signals_.async_wait([this](const boost::system::error_code& ec, int signal_number) {
    handle_signal(ec, signal_number);
  });
}

void InterruptGuard::handle_signal(const boost::system::error_code& ec, int signal_number) {
  if (ec) {
    if (ec != boost::asio::error::operation_aborted) {
      BOOST_LOG_TRIVIAL(error) << "Interrupt guard: Wait failed: " << ec.message();
    }
    return;
  }

  BOOST_LOG_TRIVIAL(warning) << "Interrupt guard: Received signal " << signal_number;
  last_signal_ = signal_number;
  interrupted_ = true;

  std::vector<std::shared_ptr<network::AbortHandle>> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& weak : handles_) {
      if (auto handle = weak.lock()) {
        targets.push_back(handle);
      }
    }
  }

  for (const auto& handle : targets) {
    handle->abort("Interrupted by signal " + std::to_string(signal_number));
  }

  if (on_interrupt_) {
    on_interrupt_(signal_number);
  }

  // Keep listening so a repeated interrupt stays a no-op instead of killing the process
  async_wait_next();
}

} // namespace upload
} // namespace cirrus
