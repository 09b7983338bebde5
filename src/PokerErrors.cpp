#include "PokerErrors.h"

const char* reasonToString(IllegalActionError::Reason reason) noexcept {
    switch (reason) {
        case IllegalActionError::Reason::NO_HAND_IN_PROGRESS: return "no_hand_in_progress";
        case IllegalActionError::Reason::UNKNOWN_PLAYER: return "unknown_player";
        case IllegalActionError::Reason::NOT_YOUR_TURN: return "not_your_turn";
        case IllegalActionError::Reason::CANNOT_CHECK: return "cannot_check";
        case IllegalActionError::Reason::NOTHING_TO_CALL: return "nothing_to_call";
        case IllegalActionError::Reason::BET_ALREADY_OPEN: return "bet_already_open";
        case IllegalActionError::Reason::BELOW_MINIMUM_RAISE: return "below_minimum_raise";
        case IllegalActionError::Reason::BETTING_NOT_REOPENED: return "betting_not_reopened";
        case IllegalActionError::Reason::INSUFFICIENT_STACK: return "insufficient_stack";
        case IllegalActionError::Reason::INVALID_ACTION: return "invalid_action";
    }
    return "unknown";
}
