#ifndef TEXT_RENDERER_H
#define TEXT_RENDERER_H

#include "BettingRound.h"
#include "Snapshot.h"
#include <string>
#include <string_view>
#include <unordered_map>

/**
 * Console rendering of table snapshots, events and hand results.
 * Reads only the views Game publishes.
 */
class TextRenderer {
public:
    static constexpr int kTableWidth = 60;
    static constexpr int kDisplaySeats = 9;

    TextRenderer() = default;

    /**
     * Display name for a player id; unknown ids render as the id itself
     */
    void setPlayerName(const std::string& playerId, const std::string& name);
    [[nodiscard]] std::string getPlayerName(const std::string& playerId) const;

    /**
     * Takes every seated player's name from a snapshot
     */
    void learnNames(const TableSnapshot& snapshot);

    /**
     * Nine-seat oval table with dealer/blind/folded markers, board and pot.
     * Seats beyond the ninth are not drawn.
     */
    [[nodiscard]] static std::string renderTable(const TableSnapshot& snapshot);

    [[nodiscard]] static std::string renderCards(const std::vector<Card>& cards);

    [[nodiscard]] static std::string renderAction(Player::Action action);

    /**
     * Turn banner and the options open to the player, e.g.
     * "Bob's options: Call (20), Raise, Fold, All-In"
     */
    [[nodiscard]] std::string renderPrompt(const std::string& playerId,
                                           const BettingRound::ActionConstraints& constraints,
                                           int pot) const;

    /**
     * One history line, or an empty string for events not worth showing
     */
    [[nodiscard]] std::string renderEvent(const GameEvent& event) const;

    /**
     * "Winner is X" / "Chopped pot between: X, Y" per pot, plus the hands
     * shown down
     */
    [[nodiscard]] std::string renderResult(const HandResult& result) const;

private:
    std::unordered_map<std::string, std::string> playerNames;

    static size_t displayWidth(std::string_view text);
    static std::string padRight(const std::string& text, size_t width);
    static std::string padLeft(const std::string& text, size_t width);
    static std::string center(const std::string& text, size_t width);

    std::string joinNames(const std::vector<std::string>& ids) const;
};

#endif // TEXT_RENDERER_H
