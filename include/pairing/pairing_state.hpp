#ifndef PASTEALL_PAIRING_STATE_HPP
#define PASTEALL_PAIRING_STATE_HPP

#include <ostream>
#include <string>
#include "core/types.hpp"

namespace pasteall {
namespace pairing {

/**
 * Per-device pairing state machine.
 *
 * UNPAIRED         - No trust relationship
 * REQUEST_SENT     - We initiated and wait for the peer's answer
 * REQUEST_RECEIVED - The peer initiated and waits for our approval
 * PAIRED           - Shared key derived, device trusted
 *
 * Any in-flight state falls back to UNPAIRED on failure, and PAIRED returns to
 * UNPAIRED only through an explicit unpair.
 */
class PairingState {
public:
    using State = core::PairingStatus;

    PairingState() : current_state_(State::Unpaired) {}

    // Entry for a relationship restored from storage
    static PairingState restored() {
        PairingState state;
        state.current_state_ = State::Paired;
        return state;
    }

    State get_state() const { return current_state_; }

    bool is_in_flight() const {
        return current_state_ == State::RequestSent ||
               current_state_ == State::RequestReceived;
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
            case State::Unpaired:
                return to == State::RequestSent ||
                       to == State::RequestReceived;

            case State::RequestSent:
            case State::RequestReceived:
                return to == State::Paired ||
                       to == State::Unpaired;

            case State::Paired:
                return to == State::Unpaired;
        }
        return false;
    }

    static std::string state_to_string(State state) {
        return core::pairing_status_to_string(state);
    }

    std::string get_state_string() const {
        return state_to_string(current_state_);
    }

private:
    State current_state_;
};

} // namespace pairing
} // namespace pasteall

#endif // PASTEALL_PAIRING_STATE_HPP
