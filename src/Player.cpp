#include "Player.h"
#include "PokerErrors.h"
#include <algorithm>

Player::Player(std::string_view playerId, std::string_view playerName, int startingChips)
    : id(playerId), name(playerName), chips(startingChips), bet(0), totalBet(0),
      handStartChips(startingChips), state(State::SITTING_OUT), lastAction(Action::NONE),
      seat(0), isDealer(false), isSmallBlind(false), isBigBlind(false),
      sitOutRequested(false) {}

void Player::dealHoleCards(const std::vector<Card>& cards) {
    holeCards = cards;
}

void Player::commit(int amount) {
    if (amount > chips) {
        throw InsufficientStackError(amount, chips);
    }

    chips -= amount;
    bet += amount;
    totalBet += amount;

    if (chips == 0 && state == State::ACTIVE) {
        state = State::ALL_IN;
    }
}

int Player::postBlind(int amount) {
    const int actualAmount = std::min(amount, chips);
    commit(actualAmount);
    return actualAmount;
}

void Player::fold() {
    state = State::FOLDED;
    lastAction = Action::FOLD;
}

void Player::winChips(int amount) {
    chips += amount;
}

void Player::resetBet() {
    bet = 0;
}

void Player::resetForNewHand() {
    holeCards.clear();
    bet = 0;
    totalBet = 0;
    handStartChips = chips;
    lastAction = Action::NONE;

    if (chips > 0 && !sitOutRequested) {
        state = State::ACTIVE;
    } else {
        state = State::SITTING_OUT;
    }

    isDealer = false;
    isSmallBlind = false;
    isBigBlind = false;
}

void Player::restoreHandStart() {
    chips = handStartChips;
    holeCards.clear();
    bet = 0;
    totalBet = 0;
    lastAction = Action::NONE;
    if (state != State::SITTING_OUT) {
        state = chips > 0 ? State::ACTIVE : State::SITTING_OUT;
    }
}

bool Player::canAct() const {
    return state == State::ACTIVE && chips > 0;
}

bool Player::isInHand() const {
    return state == State::ACTIVE || state == State::ALL_IN;
}

std::string Player::getActionName() const {
    static constexpr const char* actionNames[] = {
        "None", "Fold", "Check", "Call", "Bet", "Raise", "All-in"
    };

    const int idx = static_cast<int>(lastAction);
    if (idx >= 0 && idx < 7) {
        return actionNames[idx];
    }
    return "Unknown";
}

std::string Player::getStateName() const {
    static constexpr const char* stateNames[] = {
        "Active", "Folded", "All-in", "Sitting out"
    };

    const int idx = static_cast<int>(state);
    if (idx >= 0 && idx < 4) {
        return stateNames[idx];
    }
    return "Unknown";
}

Hand::EvaluatedHand Player::evaluateHand(const std::vector<Card>& communityCards) const {
    return Hand::evaluate(holeCards, communityCards);
}
