#ifndef PLAYER_H
#define PLAYER_H

#include "Card.h"
#include "Hand.h"
#include <vector>
#include <string>
#include <string_view>

/**
 * A seated player: identity, chip stack, hole cards and per-hand state.
 * Chip movements go through commit()/postBlind()/winChips() so that
 * stack + committed is conserved. Betting legality lives in BettingRound.
 */
class Player {
public:
    enum class Action {
        NONE,
        FOLD,
        CHECK,
        CALL,
        BET,
        RAISE,
        ALL_IN
    };

    enum class State {
        ACTIVE,       // Dealt in and able to act
        FOLDED,       // Folded this hand
        ALL_IN,       // No chips behind, still contesting the pot
        SITTING_OUT   // Not dealt in (no chips, or sitting out by choice)
    };

private:
    std::string id;
    std::string name;
    int chips;
    int bet;              // Committed in the current street
    int totalBet;         // Committed in this hand (across all streets)
    int handStartChips;   // Stack when the current hand was set up
    std::vector<Card> holeCards;
    State state;
    Action lastAction;
    int seat;
    bool isDealer;
    bool isSmallBlind;
    bool isBigBlind;
    bool sitOutRequested;

public:
    Player(std::string_view playerId, std::string_view playerName, int startingChips);

    const std::string& getId() const noexcept { return id; }
    const std::string& getName() const noexcept { return name; }
    int getChips() const noexcept { return chips; }
    int getBet() const noexcept { return bet; }
    int getTotalBet() const noexcept { return totalBet; }
    int getHandStartChips() const noexcept { return handStartChips; }
    const std::vector<Card>& getHoleCards() const noexcept { return holeCards; }
    State getState() const noexcept { return state; }
    Action getLastAction() const noexcept { return lastAction; }
    int getSeat() const noexcept { return seat; }
    bool getIsDealer() const noexcept { return isDealer; }
    bool getIsSmallBlind() const noexcept { return isSmallBlind; }
    bool getIsBigBlind() const noexcept { return isBigBlind; }
    bool isSittingOutRequested() const noexcept { return sitOutRequested; }

    void setSeat(int s) { seat = s; }
    void setDealer(bool dealer) { isDealer = dealer; }
    void setSmallBlind(bool sb) { isSmallBlind = sb; }
    void setBigBlind(bool bb) { isBigBlind = bb; }
    void setLastAction(Action action) { lastAction = action; }

    void dealHoleCards(const std::vector<Card>& cards);

    /**
     * Moves exactly `amount` chips from the stack into the current street.
     * Throws InsufficientStackError if the stack is short. Reaching zero
     * chips makes the player all-in.
     */
    void commit(int amount);

    /**
     * Posts a blind, capped at the stack. Returns the amount posted.
     */
    int postBlind(int amount);

    void fold();

    void winChips(int amount);

    /**
     * Clears the per-street commitment at the start of a new street
     */
    void resetBet();

    /**
     * Clears per-hand state and decides whether the player is dealt in
     */
    void resetForNewHand();

    /**
     * Undoes the current hand: stack back to its hand-start value
     */
    void restoreHandStart();

    /**
     * Requests to skip upcoming hands; takes effect at the next hand setup
     */
    void sitOut() { sitOutRequested = true; }
    void sitIn() { sitOutRequested = false; }

    [[nodiscard]] bool canAct() const;

    [[nodiscard]] bool isInHand() const;

    [[nodiscard]] std::string getActionName() const;

    [[nodiscard]] std::string getStateName() const;

    /**
     * Evaluates the player's best hand given the community cards
     */
    [[nodiscard]] Hand::EvaluatedHand evaluateHand(const std::vector<Card>& communityCards) const;
};

#endif // PLAYER_H
