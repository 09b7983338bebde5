#ifndef GAME_H
#define GAME_H

#include "BettingRound.h"
#include "Card.h"
#include "Deck.h"
#include "Hand.h"
#include "Player.h"
#include "Pot.h"
#include "Snapshot.h"
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

// Transparent hash for string_view lookups
struct StringHash {
    using is_transparent = void;
    using hash_type = std::hash<std::string_view>;

    size_t operator()(std::string_view sv) const { return hash_type{}(sv); }
    size_t operator()(const std::string& s) const { return hash_type{}(s); }
    size_t operator()(const char* s) const { return hash_type{}(s); }
};

struct StringEqual {
    using is_transparent = void;

    bool operator()(std::string_view lhs, std::string_view rhs) const {
        return lhs == rhs;
    }
};

/**
 * Texas Hold'em table engine: one table, one hand at a time.
 *
 * Stages run HandSetup -> PreflopBetting -> Flop -> FlopBetting -> Turn ->
 * TurnBetting -> River -> RiverBetting -> Showdown -> HandComplete. The
 * engine advances on its own until it needs a decision from the player
 * returned by getCurrentPlayer(), or the hand is complete. As soon as a
 * single player is left contesting the pot it is awarded without
 * evaluating any hand.
 *
 * The engine owns the deck, board, pot and betting round of the current
 * hand. Only player stacks and the button carry over between hands.
 */
class Game {
public:
    enum class Stage {
        WAITING,          // Between hands, before the first one or after an abort
        HAND_SETUP,
        PREFLOP_BETTING,
        FLOP,
        FLOP_BETTING,
        TURN,
        TURN_BETTING,
        RIVER,
        RIVER_BETTING,
        SHOWDOWN,
        HAND_COMPLETE
    };

    // One deck covers at most 22 players (2 * 22 + 5 = 49 cards)
    static constexpr int kMaxSeats = 22;

    struct GameConfig {
        int smallBlind;
        int bigBlind;
        int startingChips;
        int minPlayers;
        int maxPlayers;
        unsigned int seed; // 0 means random seed
        std::vector<std::string> exactCards; // Stacked on top of the deck every hand
        Pot::OddChipPolicy oddChipPolicy;

        GameConfig()
            : smallBlind(10), bigBlind(20), startingChips(1000),
              minPlayers(2), maxPlayers(9), seed(0),
              oddChipPolicy(Pot::OddChipPolicy::FIRST_LEFT_OF_DEALER) {}
    };

private:
    std::vector<std::unique_ptr<Player>> players;
    std::unordered_map<std::string, Player*, StringHash, StringEqual> playerLookup;
    Deck deck;
    Pot pot;
    std::vector<Card> communityCards;
    std::vector<Card> stackedCards;
    std::optional<BettingRound> round;
    std::optional<HandResult> lastResult;
    Stage stage;
    GameConfig config;
    int dealerPosition;
    int previousDealerPosition;
    int smallBlindPosition;
    int bigBlindPosition;
    unsigned int currentSeed;
    int handNumber;
    bool showdownReached;
    std::vector<GameEvent> history;

public:
    /**
     * Throws std::invalid_argument on an unusable config (blinds, player
     * limits or malformed stacked cards).
     */
    explicit Game(const GameConfig& cfg = GameConfig());

    Stage getStage() const noexcept { return stage; }
    const std::vector<Card>& getCommunityCards() const noexcept { return communityCards; }
    int getPotSize() const noexcept { return pot.getTotalPot(); }
    int getCurrentBet() const noexcept { return round ? round->getCurrentBet() : 0; }
    int getMinRaise() const noexcept { return round ? round->getMinRaise() : config.bigBlind; }
    int getDealerPosition() const noexcept { return dealerPosition; }
    int getHandNumber() const noexcept { return handNumber; }
    unsigned int getSeed() const noexcept { return currentSeed; }
    const GameConfig& getConfig() const noexcept { return config; }

    /**
     * Seats a player. Only between hands.
     * @param chips Starting chip count (0 means use config.startingChips)
     * @return false if the id is taken, the table is full or a hand is running
     */
    [[nodiscard]] bool addPlayer(std::string_view id, std::string_view name, int chips = 0);

    /**
     * Unseats a player. Only between hands.
     */
    [[nodiscard]] bool removePlayer(std::string_view id);

    /**
     * Skips the player from the next hand on (or resumes dealing them in)
     */
    [[nodiscard]] bool sitOut(std::string_view id);
    [[nodiscard]] bool sitIn(std::string_view id);

    [[nodiscard]] Player* getPlayer(std::string_view id);
    [[nodiscard]] const Player* getPlayer(std::string_view id) const;

    /**
     * All seated players, indexed by seat
     */
    [[nodiscard]] std::vector<Player*> getPlayers();
    [[nodiscard]] std::vector<const Player*> getPlayers() const;

    /**
     * Players with chips who are not sitting out
     */
    [[nodiscard]] int countPlayersWithChips() const;

    /**
     * Runs HandSetup and advances to the first decision. Returns false
     * when a hand is already running or too few players can be dealt in.
     * Fatal errors (EmptyDeckError, PotConservationError) abort the hand,
     * restore stacks and propagate.
     */
    [[nodiscard]] bool startHand();

    /**
     * Applies an action for the player whose turn it is. Throws
     * IllegalActionError (unchanged state, re-prompt the same player).
     * Amount is the bet/raise total for the street, ignored otherwise.
     */
    void processAction(std::string_view playerId, Player::Action action, int amount = 0);

    /**
     * Abandons the pending decision (e.g. a timeout) as an implicit fold.
     * Returns the id of the player folded.
     */
    std::string forfeitCurrentAction();

    /**
     * Abandons the running hand: every stack goes back to its hand-start
     * value, the button returns to the previous seat and the table waits
     * for the next startHand(). Returns false if no hand is running.
     */
    bool abortHand(const std::string& reason);

    [[nodiscard]] bool isHandInProgress() const noexcept;

    /**
     * Player whose action is awaited, or nullptr
     */
    [[nodiscard]] Player* getCurrentPlayer();
    [[nodiscard]] const Player* getCurrentPlayer() const;

    [[nodiscard]] BettingRound::ActionConstraints getActionConstraints() const;

    /**
     * Read-only table view for `viewerId` (empty: a spectator). Hole
     * cards are shown for the viewer's own seat, and for every player
     * still in the hand once a showdown has been reached.
     */
    [[nodiscard]] TableSnapshot snapshot(std::string_view viewerId = {}) const;

    /**
     * Outcome of the most recent completed or aborted hand
     */
    [[nodiscard]] const std::optional<HandResult>& getLastResult() const noexcept { return lastResult; }

    /**
     * Unfiltered event history of the current (or last) hand
     */
    [[nodiscard]] const std::vector<GameEvent>& getHistory() const noexcept { return history; }

    std::string getStageName() const;

    static std::string stageName(Stage stage);

private:
    void recordEvent(GameEvent event);
    [[nodiscard]] int nextSeatInHand(int fromSeat) const;
    [[nodiscard]] std::vector<int> liveSeats() const;
    void setupHand();
    void beginStreet(BettingRound::Street street, Stage bettingStage, int firstSeat);
    void dealBoard(size_t count, const char* streetLabel);
    void advance();
    void guarded(void (Game::*step)());
    void showdown();
    void awardUncontested(int seat);
    void finishHand(const std::vector<Pot::TierAward>& awards, bool wentToShowdown,
                    std::vector<PlayerHandResult> hands);
    [[nodiscard]] bool canSeeHoleCards(const Player& player, std::string_view viewerId) const;
};

#endif // GAME_H
