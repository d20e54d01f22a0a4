#ifndef CIRRUS_UPLOAD_STATE_HPP
#define CIRRUS_UPLOAD_STATE_HPP

#include <ostream>
#include <string>

namespace cirrus {
namespace upload {

/**
 * UploadState tracks the lifecycle of one upload attempt.
 * Transitions only move forward; an attempt never re-enters a phase.
 */
class UploadState {
public:
    /**
     * Upload states:
     * IDLE         - Orchestrator constructed, nothing started
     * PREPARING    - Validating the source and resolving the target
     * TRANSFERRING - Encrypting and sending the body
     * SUCCEEDED    - Endpoint acknowledged the object with a fingerprint
     * FAILED       - Any error other than cancellation
     * ABORTED      - The abort handle fired
     */
    enum class State {
        IDLE,
        PREPARING,
        TRANSFERRING,
        SUCCEEDED,
        FAILED,
        ABORTED
    };

    UploadState() : current_state_(State::IDLE) {}

    State get_state() const { return current_state_; }

    /**
     * Check if the attempt has finished, successfully or not.
     * @return true if in terminal state
     */
    bool is_terminal() const {
        return current_state_ == State::SUCCEEDED ||
               current_state_ == State::FAILED ||
               current_state_ == State::ABORTED;
    }

    /**
     * Attempt to transition to a new state.
     * @param new_state The target state
     * @return true if transition was successful, false if invalid
     */
    bool transition_to(State new_state) {
        if (!is_valid_transition(current_state_, new_state)) {
            return false;
        }
        current_state_ = new_state;
        return true;
    }

    static bool is_valid_transition(State from, State to) {
        switch (from) {
            case State::IDLE:
                return to == State::PREPARING;

            case State::PREPARING:
                return to == State::TRANSFERRING ||
                       to == State::FAILED ||
                       to == State::ABORTED;

            case State::TRANSFERRING:
                return to == State::SUCCEEDED ||
                       to == State::FAILED ||
                       to == State::ABORTED;

            case State::SUCCEEDED:
            case State::FAILED:
            case State::ABORTED:
                return false;
        }
        return false;
    }

    static std::string state_to_string(State state) {
        switch (state) {
            case State::IDLE:         return "IDLE";
            case State::PREPARING:    return "PREPARING";
            case State::TRANSFERRING: return "TRANSFERRING";
            case State::SUCCEEDED:    return "SUCCEEDED";
            case State::FAILED:       return "FAILED";
            case State::ABORTED:      return "ABORTED";
            default:                  return "UNKNOWN";
        }
    }

    std::string get_state_string() const {
        return state_to_string(current_state_);
    }

private:
    State current_state_;
};

// Stream operator for UploadState::State to support test assertions and logging
inline std::ostream& operator<<(std::ostream& os, const UploadState::State& state) {
    os << UploadState::state_to_string(state);
    return os;
}

} // namespace upload
} // namespace cirrus

#endif // CIRRUS_UPLOAD_STATE_HPP
