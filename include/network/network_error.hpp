#ifndef CIRRUS_NETWORK_ERROR_HPP
#define CIRRUS_NETWORK_ERROR_HPP

#include <stdexcept>
#include <string>

namespace cirrus {
namespace network {

class NetworkError : public std::runtime_error {
public:
    explicit NetworkError(const std::string& message)
        : std::runtime_error(message) {}
};

// The upload destination could not be resolved for the account/bucket
class TargetResolutionError : public NetworkError {
public:
    explicit TargetResolutionError(const std::string& message)
        : NetworkError("Target resolution failed: " + message) {}
};

// The storage network refused to finalize a transferred object
class CommitError : public NetworkError {
public:
    explicit CommitError(const std::string& message)
        : NetworkError("Commit failed: " + message) {}
};

// Transport or HTTP level failure. status is 0 when no response was received.
class TransferError : public NetworkError {
public:
    explicit TransferError(const std::string& message, unsigned status = 0)
        : NetworkError("Transfer failed: " + message)
        , status_(status) {}

    unsigned status() const { return status_; }

private:
    unsigned status_;
};

// The endpoint accepted the body but did not acknowledge it with an ETag
class MissingFingerprintError : public NetworkError {
public:
    MissingFingerprintError()
        : NetworkError("Missing ETag in upload response") {}
};

// The abort handle fired before the response arrived
class TransferAbortedError : public NetworkError {
public:
    explicit TransferAbortedError(const std::string& reason)
        : NetworkError("Transfer aborted: " + reason)
        , reason_(reason) {}

    const std::string& reason() const { return reason_; }

private:
    std::string reason_;
};

} // namespace network
} // namespace cirrus

#endif // CIRRUS_NETWORK_ERROR_HPP
