#ifndef SNAPSHOT_H
#define SNAPSHOT_H

#include "Card.h"
#include "Player.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

/**
 * One entry of the per-hand event history.
 */
struct GameEvent {
    enum class Type {
        HAND_STARTED,
        BLIND_POSTED,
        HOLE_CARDS_DEALT,
        PLAYER_ACTION,
        BOARD_DEALT,
        SHOWDOWN,
        POT_AWARDED,
        HAND_ABORTED
    };

    Type type;
    int handNumber;
    std::string playerId;             // Empty for table-wide events
    Player::Action action;            // PLAYER_ACTION only
    int amount;                       // Chips moved or awarded
    int total;                        // Street commitment after a PLAYER_ACTION
    std::vector<Card> cards;          // Hole cards, board tranche or best five
    std::string detail;               // Street name, hand description, abort reason

    GameEvent()
        : type(Type::HAND_STARTED), handNumber(0), action(Player::Action::NONE),
          amount(0), total(0) {}
};

/**
 * What a display collaborator may see of one seat.
 */
struct PlayerView {
    std::string id;
    std::string name;
    int seat;
    int chips;
    int bet;
    int totalBet;
    Player::State state;
    Player::Action lastAction;
    bool isDealer;
    bool isSmallBlind;
    bool isBigBlind;
    bool holeCardsVisible;
    std::vector<Card> holeCards;      // Empty unless visible to the viewer

    PlayerView()
        : seat(0), chips(0), bet(0), totalBet(0), state(Player::State::SITTING_OUT),
          lastAction(Player::Action::NONE), isDealer(false), isSmallBlind(false),
          isBigBlind(false), holeCardsVisible(false) {}
};

struct PotView {
    int amount;
    std::vector<std::string> eligiblePlayerIds;

    PotView() : amount(0) {}
};

/**
 * Read-only view of the table for one viewer. Produced by
 * Game::snapshot(); never feeds back into the engine.
 */
struct TableSnapshot {
    std::string stage;
    std::string street;               // Empty outside betting
    int handNumber;
    std::vector<Card> board;
    std::vector<PotView> pots;        // Main pot first, then side pots
    int totalPot;
    int currentBet;
    int minRaise;
    int dealerSeat;
    std::optional<std::string> currentPlayerId;
    std::vector<PlayerView> players;
    std::vector<GameEvent> history;

    TableSnapshot()
        : handNumber(0), totalPot(0), currentBet(0), minRaise(0), dealerSeat(-1) {}
};

struct TierResult {
    int amount;
    std::vector<std::string> eligiblePlayerIds;
    std::vector<std::string> winnerIds;
    std::map<std::string, int> awards;

    TierResult() : amount(0) {}
};

struct PlayerHandResult {
    std::string playerId;
    std::string handRanking;
    std::string description;
    std::vector<Card> bestFive;
};

/**
 * Terminal outcome of a hand, published at HandComplete (or on abort).
 */
struct HandResult {
    int handNumber;
    bool showdown;
    bool aborted;
    std::string abortReason;
    std::vector<Card> board;
    std::vector<TierResult> tiers;
    std::map<std::string, int> payouts;       // Chips won per player
    std::map<std::string, int> finalStacks;
    std::vector<PlayerHandResult> hands;      // Showdown only

    HandResult() : handNumber(0), showdown(false), aborted(false) {}
};

#endif // SNAPSHOT_H
