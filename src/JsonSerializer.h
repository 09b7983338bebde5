#ifndef JSON_SERIALIZER_H
#define JSON_SERIALIZER_H

#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>
#include "BettingRound.h"
#include "Game.h"
#include "Player.h"
#include "PokerErrors.h"
#include "Snapshot.h"

using json = nlohmann::json;

/**
 * JsonSerializer - Utility class for converting between engine views and JSON
 *
 * Provides static methods for serialization/deserialization of:
 * - Player::Action, Player::State and event types to/from strings
 * - Table snapshots, event history and hand results to JSON
 * - GameConfig from JSON objects and files
 *
 * The engine never depends on this class; it only reads the views that
 * Game publishes.
 */
class JsonSerializer {
public:
    /**
     * Converts a Player::Action enum to string ("fold", "all_in", ...)
     */
    [[nodiscard]] static std::string actionToString(Player::Action action);

    /**
     * Converts a string to Player::Action enum
     * Uses static map for O(1) lookup; unknown names map to NONE
     */
    [[nodiscard]] static Player::Action stringToAction(std::string_view str);

    [[nodiscard]] static std::string stateToString(Player::State state);

    [[nodiscard]] static std::string eventTypeToString(GameEvent::Type type);

    [[nodiscard]] static std::string oddChipPolicyToString(Pot::OddChipPolicy policy);

    /**
     * Throws std::invalid_argument on an unknown policy name
     */
    [[nodiscard]] static Pot::OddChipPolicy stringToOddChipPolicy(std::string_view str);

    [[nodiscard]] static json cardsToJson(const std::vector<Card>& cards);

    [[nodiscard]] static json eventToJson(const GameEvent& event);

    [[nodiscard]] static json playerViewToJson(const PlayerView& player);

    /**
     * Full table view as seen by the snapshot's viewer
     */
    [[nodiscard]] static json snapshotToJson(const TableSnapshot& snapshot);

    [[nodiscard]] static json handResultToJson(const HandResult& result);

    [[nodiscard]] static json constraintsToJson(const BettingRound::ActionConstraints& constraints);

    /**
     * Rejected action as {"error": "illegal_action", "reason": ..., "message": ...}
     */
    [[nodiscard]] static json illegalActionToJson(const IllegalActionError& error);

    [[nodiscard]] static json configToJson(const Game::GameConfig& config);

    /**
     * Builds a GameConfig from a JSON object. Missing keys keep their
     * defaults. Throws json::exception on mistyped values.
     */
    [[nodiscard]] static Game::GameConfig configFromJson(const json& j);

    /**
     * Reads and parses a JSON config file. Throws std::runtime_error if
     * the file cannot be opened.
     */
    [[nodiscard]] static Game::GameConfig loadConfigFile(const std::string& path);
};

#endif // JSON_SERIALIZER_H
