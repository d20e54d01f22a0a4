#ifndef CIRRUS_NETWORK_ABORT_HANDLE_HPP
#define CIRRUS_NETWORK_ABORT_HANDLE_HPP

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace cirrus {
namespace network {

// Single-use cancellation token shared between the caller and the in-flight
// upload. The first abort() wins; later calls are no-ops. Listeners run on the
// aborting thread while the handle's lock is held, so a listener must not call
// back into the handle other than through aborted().
class AbortHandle {
public:
    using Listener = std::function<void(const std::string& reason)>;
    using ListenerId = std::uint64_t;

    // Removes its listener when it goes out of scope
    class ScopedListener {
    public:
        ScopedListener(AbortHandle& handle, Listener listener);
        ~ScopedListener();

        ScopedListener(const ScopedListener&) = delete;
        ScopedListener& operator=(const ScopedListener&) = delete;

    private:
        AbortHandle& handle_;
        ListenerId id_;
    };


    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    AbortHandle() = default;
    AbortHandle(const AbortHandle&) = delete;
    AbortHandle& operator=(const AbortHandle&) = delete;


    // ---- CANCELLATION ----
    // Fires the handle. Returns true only for the call that actually fired it.
    bool abort(const std::string& reason = "Aborted by caller");
    bool aborted() const { return aborted_.load(); }
    std::string reason() const;
    // Throws TransferAbortedError if the handle has fired
    void throw_if_aborted() const;


    // ---- LISTENERS ----
    // Registers a listener; runs it immediately if the handle already fired
    ListenerId add_listener(Listener listener);
    // Blocks while listeners are running, so after it returns the listener
    // will never be invoked again
    void remove_listener(ListenerId id);

private:
    // ---- PARAMETERS ----
    mutable std::mutex mutex_;
    std::atomic<bool> aborted_{false};
    std::string reason_;
    std::map<ListenerId, Listener> listeners_;
    ListenerId next_id_ = 1;
};

} // namespace network
} // namespace cirrus

#endif // CIRRUS_NETWORK_ABORT_HANDLE_HPP
