#include "BettingRound.h"
#include "PokerErrors.h"
#include <algorithm>

BettingRound::BettingRound(Street s, std::vector<Player*> seats, Pot& p,
                           int bigBlind, int firstSeat)
    : street(s), players(std::move(seats)), pot(p),
      currentBet(0), minRaise(bigBlind), lastAggressor(-1), currentSeat(-1) {

    const int seatCount = static_cast<int>(players.size());
    for (int seat = 0; seat < seatCount; seat++) {
        const Player* player = players[seat];
        if (player->isInHand()) {
            currentBet = std::max(currentBet, player->getBet());
        }
        if (player->canAct()) {
            pendingSeats.insert(seat);
        }
    }

    // A big blind posted short still leaves the full blind to call
    if (street == Street::PREFLOP) {
        currentBet = std::max(currentBet, bigBlind);
    }

    closeIfUncontested();

    if (!pendingSeats.empty() && seatCount > 0) {
        const int start = ((firstSeat % seatCount) + seatCount) % seatCount;
        currentSeat = nextPendingSeat(start - 1);
    }
}

int BettingRound::liveCount() const {
    return static_cast<int>(std::count_if(players.begin(), players.end(),
        [](const Player* player) { return player->isInHand(); }));
}

void BettingRound::closeIfUncontested() {
    if (liveCount() <= 1) {
        pendingSeats.clear();
        return;
    }

    // Everyone else is all-in: the lone player only acts while still owing chips
    std::vector<int> ableToAct;
    for (int seat = 0; seat < static_cast<int>(players.size()); seat++) {
        if (players[seat]->canAct()) {
            ableToAct.push_back(seat);
        }
    }
    if (ableToAct.empty() ||
        (ableToAct.size() == 1 && players[ableToAct.front()]->getBet() >= currentBet)) {
        pendingSeats.clear();
    }
}

int BettingRound::nextPendingSeat(int fromSeat) const {
    const int seatCount = static_cast<int>(players.size());
    for (int step = 1; step <= seatCount; step++) {
        const int seat = (fromSeat + step + seatCount) % seatCount;
        if (pendingSeats.count(seat)) {
            return seat;
        }
    }
    return -1;
}

void BettingRound::applyFullRaise(int seat, int newBet) {
    minRaise = std::max(minRaise, newBet - currentBet);
    currentBet = newBet;
    lastAggressor = seat;

    betFacedWhenActed.clear();
    raiseLockedSeats.clear();
    pendingSeats.clear();
    for (int other = 0; other < static_cast<int>(players.size()); other++) {
        if (other != seat && players[other]->canAct()) {
            pendingSeats.insert(other);
        }
    }
}

void BettingRound::applyIncompleteRaise(int seat, int newBet) {
    currentBet = newBet;
    lastAggressor = seat;

    // Players who owe chips act again. Those who already acted may only call
    // or fold until the short all-ins add up to a full raise over their action.
    for (int other = 0; other < static_cast<int>(players.size()); other++) {
        const Player* player = players[other];
        if (other == seat || !player->canAct() || player->getBet() >= currentBet) {
            continue;
        }
        pendingSeats.insert(other);

        auto acted = betFacedWhenActed.find(other);
        if (acted == betFacedWhenActed.end()) {
            continue;
        }
        if (currentBet - acted->second >= minRaise) {
            raiseLockedSeats.erase(other);
        } else {
            raiseLockedSeats.insert(other);
        }
    }
}

void BettingRound::raiseTo(Player* player, int seat, int amount, ActionRecord& record) {
    if (raiseLockedSeats.count(seat)) {
        throw IllegalActionError(IllegalActionError::Reason::BETTING_NOT_REOPENED,
            "Betting was not reopened by the short all-in; call or fold");
    }

    const int needed = amount - player->getBet();
    if (needed > player->getChips()) {
        throw InsufficientStackError(needed, player->getChips());
    }

    const int minRaiseTo = currentBet + minRaise;
    if (amount < minRaiseTo) {
        throw IllegalActionError::belowMinimumRaise(amount, minRaiseTo);
    }

    player->commit(needed);
    pot.contribute(seat, needed);
    record.chipsCommitted = needed;
    if (player->getChips() == 0) {
        record.action = Player::Action::ALL_IN;
    }

    applyFullRaise(seat, amount);
    record.reopened = true;
}

BettingRound::ActionRecord BettingRound::act(int seat, Player::Action action, int amount) {
    if (isComplete()) {
        throw IllegalActionError(IllegalActionError::Reason::NO_HAND_IN_PROGRESS,
            "Betting round is complete");
    }
    if (seat < 0 || seat >= static_cast<int>(players.size())) {
        throw IllegalActionError(IllegalActionError::Reason::UNKNOWN_PLAYER,
            "No player in seat " + std::to_string(seat));
    }

    Player* player = players[seat];
    if (seat != currentSeat) {
        throw IllegalActionError::notYourTurn(player->getId(), players[currentSeat]->getId());
    }

    const int toCall = currentBet - player->getBet();
    ActionRecord record{seat, action, 0, 0, false};

    switch (action) {
        case Player::Action::FOLD:
            player->fold();
            break;

        case Player::Action::CHECK:
            if (toCall > 0) {
                throw IllegalActionError(IllegalActionError::Reason::CANNOT_CHECK,
                    "Cannot check facing a bet of " + std::to_string(toCall));
            }
            break;

        case Player::Action::CALL: {
            if (toCall <= 0) {
                throw IllegalActionError(IllegalActionError::Reason::NOTHING_TO_CALL,
                    "Nothing to call; check instead");
            }
            const int payment = std::min(toCall, player->getChips());
            player->commit(payment);
            pot.contribute(seat, payment);
            record.chipsCommitted = payment;
            if (player->getChips() == 0) {
                record.action = Player::Action::ALL_IN;
            }
            break;
        }

        case Player::Action::BET:
            if (currentBet > 0) {
                throw IllegalActionError(IllegalActionError::Reason::BET_ALREADY_OPEN,
                    "Cannot bet when there is already a bet; raise instead");
            }
            raiseTo(player, seat, amount, record);
            break;

        case Player::Action::RAISE:
            raiseTo(player, seat, amount, record);
            break;

        case Player::Action::ALL_IN: {
            const int chips = player->getChips();
            const int total = player->getBet() + chips;
            if (total > currentBet && raiseLockedSeats.count(seat)) {
                throw IllegalActionError(IllegalActionError::Reason::BETTING_NOT_REOPENED,
                    "Betting was not reopened by the short all-in; call or fold");
            }

            player->commit(chips);
            pot.contribute(seat, chips);
            record.chipsCommitted = chips;

            if (total > currentBet) {
                if (total - currentBet >= minRaise) {
                    applyFullRaise(seat, total);
                    record.reopened = true;
                } else {
                    applyIncompleteRaise(seat, total);
                }
            }
            break;
        }

        default:
            throw IllegalActionError(IllegalActionError::Reason::INVALID_ACTION,
                "Invalid action");
    }

    player->setLastAction(record.action);
    record.streetTotal = player->getBet();
    pendingSeats.erase(seat);
    betFacedWhenActed[seat] = currentBet;
    raiseLockedSeats.erase(seat);

    closeIfUncontested();

    if (!pendingSeats.empty()) {
        currentSeat = nextPendingSeat(seat);
    }

    return record;
}

BettingRound::ActionConstraints BettingRound::getConstraints() const {
    ActionConstraints constraints;
    if (isComplete()) {
        return constraints;
    }

    const Player* player = players[currentSeat];
    constraints.canAct = true;
    constraints.seat = currentSeat;
    constraints.currentBet = currentBet;
    constraints.minRaise = minRaise;
    constraints.playerChips = player->getChips();
    constraints.playerBet = player->getBet();
    constraints.toCall = currentBet - player->getBet();
    constraints.minRaiseTo = currentBet + minRaise;
    constraints.maxRaiseTo = player->getBet() + player->getChips();

    const bool locked = raiseLockedSeats.count(currentSeat) > 0;
    const bool canFullRaise = !locked && constraints.maxRaiseTo >= constraints.minRaiseTo;

    auto& legal = constraints.legalActions;
    legal.push_back(Player::Action::FOLD);
    if (constraints.toCall <= 0) {
        legal.push_back(Player::Action::CHECK);
        if (canFullRaise) {
            legal.push_back(currentBet == 0 ? Player::Action::BET : Player::Action::RAISE);
        }
    } else {
        legal.push_back(Player::Action::CALL);
        if (canFullRaise) {
            legal.push_back(Player::Action::RAISE);
        }
    }
    if (!locked || constraints.playerChips <= constraints.toCall) {
        legal.push_back(Player::Action::ALL_IN);
    }

    return constraints;
}

std::string BettingRound::streetName(Street street) {
    switch (street) {
        case Street::PREFLOP: return "Preflop";
        case Street::FLOP: return "Flop";
        case Street::TURN: return "Turn";
        case Street::RIVER: return "River";
    }
    return "Unknown";
}
