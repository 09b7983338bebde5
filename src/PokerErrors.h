#ifndef POKER_ERRORS_H
#define POKER_ERRORS_H

#include <stdexcept>
#include <string>

/**
 * Raised when a caller submits an action that the current betting state
 * does not permit. Recoverable: nothing was mutated and the same actor
 * should be asked again.
 */
class IllegalActionError : public std::runtime_error {
public:
    enum class Reason {
        NO_HAND_IN_PROGRESS,
        UNKNOWN_PLAYER,
        NOT_YOUR_TURN,
        CANNOT_CHECK,
        NOTHING_TO_CALL,
        BET_ALREADY_OPEN,
        BELOW_MINIMUM_RAISE,
        BETTING_NOT_REOPENED,
        INSUFFICIENT_STACK,
        INVALID_ACTION
    };

    IllegalActionError(Reason reason, const std::string& message)
        : std::runtime_error(message), reason_(reason) {}

    Reason reason() const noexcept { return reason_; }

    static IllegalActionError notYourTurn(const std::string& playerId, const std::string& currentId) {
        return IllegalActionError(Reason::NOT_YOUR_TURN,
            "Not " + playerId + "'s turn (waiting on " + currentId + ")");
    }

    static IllegalActionError noHandInProgress() {
        return IllegalActionError(Reason::NO_HAND_IN_PROGRESS, "No betting round in progress");
    }

    static IllegalActionError unknownPlayer(const std::string& playerId) {
        return IllegalActionError(Reason::UNKNOWN_PLAYER, "Unknown player: " + playerId);
    }

    static IllegalActionError belowMinimumRaise(int raiseTo, int minRaiseTo) {
        return IllegalActionError(Reason::BELOW_MINIMUM_RAISE,
            "Raise to " + std::to_string(raiseTo) + " is below the minimum of " +
            std::to_string(minRaiseTo));
    }

private:
    Reason reason_;
};

/**
 * A bet or raise asked for more chips than the player holds. Callers
 * should offer all-in instead.
 */
class InsufficientStackError : public IllegalActionError {
public:
    InsufficientStackError(int requested, int available)
        : IllegalActionError(Reason::INSUFFICIENT_STACK,
              "Insufficient stack: needs " + std::to_string(requested) +
              " but only " + std::to_string(available) + " available (go all-in instead)"),
          requested_(requested), available_(available) {}

    int requested() const noexcept { return requested_; }
    int available() const noexcept { return available_; }

private:
    int requested_;
    int available_;
};

/**
 * Dealing from an exhausted deck. Unreachable with a legal seat count;
 * aborts the hand.
 */
class EmptyDeckError : public std::logic_error {
public:
    EmptyDeckError() : std::logic_error("No cards left in deck") {}
};

/**
 * Pot resolution would award a different total than was contributed.
 * Nothing is awarded; the hand is aborted.
 */
class PotConservationError : public std::logic_error {
public:
    PotConservationError(long long contributed, long long awarded)
        : std::logic_error("Pot conservation violated: contributed " +
              std::to_string(contributed) + ", awarded " + std::to_string(awarded)) {}
};

[[nodiscard]] const char* reasonToString(IllegalActionError::Reason reason) noexcept;

#endif // POKER_ERRORS_H
