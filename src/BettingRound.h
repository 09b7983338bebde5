#ifndef BETTING_ROUND_H
#define BETTING_ROUND_H

#include "Player.h"
#include "Pot.h"
#include <map>
#include <set>
#include <string>
#include <vector>

/**
 * One street of betting: AwaitingAction(seat) until the set of players
 * still to act is empty, then RoundComplete.
 *
 * Bet and raise amounts are "raise to" totals for the street. A player
 * who already acted may raise again only once the bet has grown by a
 * full raise since then, whether by one raise or several short all-ins.
 * Every
 * accepted action moves chips through the Player and records them in the
 * Pot. Rejected actions throw IllegalActionError and change nothing.
 *
 * Players are addressed by seat index into the vector given at
 * construction; the round does not own them.
 */
class BettingRound {
public:
    enum class Street {
        PREFLOP,
        FLOP,
        TURN,
        RIVER
    };

    struct ActionConstraints {
        bool canAct;
        int seat;
        std::vector<Player::Action> legalActions;
        int toCall;
        int currentBet;
        int minRaise;       // Minimum raise increment
        int minRaiseTo;     // Smallest legal bet/raise total
        int maxRaiseTo;     // Everything the player has
        int playerChips;
        int playerBet;

        ActionConstraints()
            : canAct(false), seat(-1), toCall(0), currentBet(0), minRaise(0),
              minRaiseTo(0), maxRaiseTo(0), playerChips(0), playerBet(0) {}
    };

    struct ActionRecord {
        int seat;
        Player::Action action;
        int chipsCommitted;  // Moved from stack to pot by this action
        int streetTotal;     // Player's street commitment afterwards
        bool reopened;       // Full raise: everyone else acts again
    };

private:
    Street street;
    std::vector<Player*> players;
    Pot& pot;
    int currentBet;
    int minRaise;
    int lastAggressor;
    int currentSeat;
    std::set<int> pendingSeats;
    std::map<int, int> betFacedWhenActed;  // Street bet level each seat last acted against
    std::set<int> raiseLockedSeats;

    int liveCount() const;
    void closeIfUncontested();
    int nextPendingSeat(int fromSeat) const;
    void applyFullRaise(int seat, int newBet);
    void applyIncompleteRaise(int seat, int newBet);
    void raiseTo(Player* player, int seat, int amount, ActionRecord& record);

public:
    /**
     * Starts a street. Blinds, if any, must already be committed. Action
     * begins at the first seat from `firstSeat` (inclusive, clockwise)
     * that is able to act. Preflop the bet to call is at least `bigBlind`.
     */
    BettingRound(Street street, std::vector<Player*> players, Pot& pot,
                 int bigBlind, int firstSeat);

    /**
     * Applies an action for `seat`. Throws IllegalActionError (or
     * InsufficientStackError) when the action is not permitted.
     */
    ActionRecord act(int seat, Player::Action action, int amount = 0);

    /**
     * Legal options for the player whose turn it is
     */
    [[nodiscard]] ActionConstraints getConstraints() const;

    [[nodiscard]] bool isComplete() const noexcept { return pendingSeats.empty(); }

    Street getStreet() const noexcept { return street; }
    int getCurrentBet() const noexcept { return currentBet; }
    int getMinRaise() const noexcept { return minRaise; }
    int getLastAggressor() const noexcept { return lastAggressor; }

    /**
     * Seat whose action is awaited, or -1 once the round is complete
     */
    int getCurrentSeat() const noexcept { return isComplete() ? -1 : currentSeat; }

    static std::string streetName(Street street);
};

#endif // BETTING_ROUND_H
