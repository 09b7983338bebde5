#include "JsonSerializer.h"
#include <fstream>
#include <stdexcept>
#include <unordered_map>

std::string JsonSerializer::actionToString(Player::Action action) {
    switch (action) {
        case Player::Action::NONE: return "none";
        case Player::Action::FOLD: return "fold";
        case Player::Action::CHECK: return "check";
        case Player::Action::CALL: return "call";
        case Player::Action::BET: return "bet";
        case Player::Action::RAISE: return "raise";
        case Player::Action::ALL_IN: return "all_in";
        default: return "unknown";
    }
}

Player::Action JsonSerializer::stringToAction(std::string_view str) {
    static const std::unordered_map<std::string_view, Player::Action> actionMap = {
        {"fold", Player::Action::FOLD},
        {"check", Player::Action::CHECK},
        {"call", Player::Action::CALL},
        {"bet", Player::Action::BET},
        {"raise", Player::Action::RAISE},
        {"all_in", Player::Action::ALL_IN},
        {"allin", Player::Action::ALL_IN}
    };

    auto it = actionMap.find(str);
    return (it != actionMap.end()) ? it->second : Player::Action::NONE;
}

std::string JsonSerializer::stateToString(Player::State state) {
    switch (state) {
        case Player::State::ACTIVE: return "active";
        case Player::State::FOLDED: return "folded";
        case Player::State::ALL_IN: return "all_in";
        case Player::State::SITTING_OUT: return "sitting_out";
        default: return "unknown";
    }
}

std::string JsonSerializer::eventTypeToString(GameEvent::Type type) {
    switch (type) {
        case GameEvent::Type::HAND_STARTED: return "hand_started";
        case GameEvent::Type::BLIND_POSTED: return "blind_posted";
        case GameEvent::Type::HOLE_CARDS_DEALT: return "hole_cards_dealt";
        case GameEvent::Type::PLAYER_ACTION: return "player_action";
        case GameEvent::Type::BOARD_DEALT: return "board_dealt";
        case GameEvent::Type::SHOWDOWN: return "showdown";
        case GameEvent::Type::POT_AWARDED: return "pot_awarded";
        case GameEvent::Type::HAND_ABORTED: return "hand_aborted";
        default: return "unknown";
    }
}

std::string JsonSerializer::oddChipPolicyToString(Pot::OddChipPolicy policy) {
    switch (policy) {
        case Pot::OddChipPolicy::FIRST_LEFT_OF_DEALER: return "first_left_of_dealer";
        case Pot::OddChipPolicy::SPREAD_LEFT_OF_DEALER: return "spread_left_of_dealer";
        default: return "unknown";
    }
}

Pot::OddChipPolicy JsonSerializer::stringToOddChipPolicy(std::string_view str) {
    if (str == "first_left_of_dealer") {
        return Pot::OddChipPolicy::FIRST_LEFT_OF_DEALER;
    }
    if (str == "spread_left_of_dealer") {
        return Pot::OddChipPolicy::SPREAD_LEFT_OF_DEALER;
    }
    throw std::invalid_argument("Unknown odd chip policy: " + std::string(str));
}

json JsonSerializer::cardsToJson(const std::vector<Card>& cards) {
    json cardsJson = json::array();
    for (const auto& card : cards) {
        cardsJson.push_back(card.toString());
    }
    return cardsJson;
}

json JsonSerializer::eventToJson(const GameEvent& event) {
    json j = {
        {"type", eventTypeToString(event.type)},
        {"handNumber", event.handNumber}
    };

    if (!event.playerId.empty()) {
        j["playerId"] = event.playerId;
    }

    switch (event.type) {
        case GameEvent::Type::PLAYER_ACTION:
            j["action"] = actionToString(event.action);
            j["amount"] = event.amount;
            j["total"] = event.total;
            break;
        case GameEvent::Type::BLIND_POSTED:
            j["amount"] = event.amount;
            j["total"] = event.total;
            break;
        case GameEvent::Type::HAND_STARTED:
        case GameEvent::Type::POT_AWARDED:
            j["amount"] = event.amount;
            break;
        default:
            break;
    }

    if (!event.cards.empty()) {
        j["cards"] = cardsToJson(event.cards);
    }
    if (!event.detail.empty()) {
        j["detail"] = event.detail;
    }

    return j;
}

json JsonSerializer::playerViewToJson(const PlayerView& player) {
    // Hidden hole cards serialize as null rather than an empty hand
    json holeCards = player.holeCardsVisible ? cardsToJson(player.holeCards) : json(nullptr);

    return json{
        {"id", player.id},
        {"name", player.name},
        {"seat", player.seat},
        {"chips", player.chips},
        {"bet", player.bet},
        {"totalBet", player.totalBet},
        {"state", stateToString(player.state)},
        {"lastAction", actionToString(player.lastAction)},
        {"isDealer", player.isDealer},
        {"isSmallBlind", player.isSmallBlind},
        {"isBigBlind", player.isBigBlind},
        {"holeCards", std::move(holeCards)}
    };
}

json JsonSerializer::snapshotToJson(const TableSnapshot& snapshot) {
    json potsJson = json::array();
    for (const auto& pot : snapshot.pots) {
        potsJson.push_back({
            {"amount", pot.amount},
            {"eligiblePlayerIds", pot.eligiblePlayerIds}
        });
    }

    json playersJson = json::array();
    for (const auto& player : snapshot.players) {
        playersJson.push_back(playerViewToJson(player));
    }

    json historyJson = json::array();
    for (const auto& event : snapshot.history) {
        historyJson.push_back(eventToJson(event));
    }

    json currentPlayerId = snapshot.currentPlayerId ? json(*snapshot.currentPlayerId) : json(nullptr);

    return json{
        {"stage", snapshot.stage},
        {"street", snapshot.street},
        {"handNumber", snapshot.handNumber},
        {"board", cardsToJson(snapshot.board)},
        {"pots", std::move(potsJson)},
        {"totalPot", snapshot.totalPot},
        {"currentBet", snapshot.currentBet},
        {"minRaise", snapshot.minRaise},
        {"dealerSeat", snapshot.dealerSeat},
        {"currentPlayerId", std::move(currentPlayerId)},
        {"players", std::move(playersJson)},
        {"history", std::move(historyJson)}
    };
}

json JsonSerializer::handResultToJson(const HandResult& result) {
    json tiersJson = json::array();
    for (const auto& tier : result.tiers) {
        tiersJson.push_back({
            {"amount", tier.amount},
            {"eligiblePlayerIds", tier.eligiblePlayerIds},
            {"winnerIds", tier.winnerIds},
            {"awards", tier.awards}
        });
    }

    json handsJson = json::array();
    for (const auto& hand : result.hands) {
        handsJson.push_back({
            {"playerId", hand.playerId},
            {"handRanking", hand.handRanking},
            {"description", hand.description},
            {"bestFive", cardsToJson(hand.bestFive)}
        });
    }

    json j = {
        {"handNumber", result.handNumber},
        {"showdown", result.showdown},
        {"aborted", result.aborted},
        {"board", cardsToJson(result.board)},
        {"pots", std::move(tiersJson)},
        {"payouts", result.payouts},
        {"finalStacks", result.finalStacks},
        {"hands", std::move(handsJson)}
    };

    if (result.aborted) {
        j["abortReason"] = result.abortReason;
    }

    return j;
}

json JsonSerializer::constraintsToJson(const BettingRound::ActionConstraints& constraints) {
    json legal = json::array();
    for (auto action : constraints.legalActions) {
        legal.push_back(actionToString(action));
    }

    return json{
        {"canAct", constraints.canAct},
        {"seat", constraints.seat},
        {"legalActions", std::move(legal)},
        {"toCall", constraints.toCall},
        {"currentBet", constraints.currentBet},
        {"minRaise", constraints.minRaise},
        {"minRaiseTo", constraints.minRaiseTo},
        {"maxRaiseTo", constraints.maxRaiseTo},
        {"playerChips", constraints.playerChips},
        {"playerBet", constraints.playerBet}
    };
}

json JsonSerializer::illegalActionToJson(const IllegalActionError& error) {
    return json{
        {"error", "illegal_action"},
        {"reason", reasonToString(error.reason())},
        {"message", error.what()}
    };
}

json JsonSerializer::configToJson(const Game::GameConfig& config) {
    return json{
        {"smallBlind", config.smallBlind},
        {"bigBlind", config.bigBlind},
        {"startingChips", config.startingChips},
        {"minPlayers", config.minPlayers},
        {"maxPlayers", config.maxPlayers},
        {"seed", config.seed},
        {"exactCards", config.exactCards},
        {"oddChipPolicy", oddChipPolicyToString(config.oddChipPolicy)}
    };
}

Game::GameConfig JsonSerializer::configFromJson(const json& j) {
    Game::GameConfig config;

    // Use value() with defaults for cleaner code
    config.smallBlind = j.value("smallBlind", config.smallBlind);
    config.bigBlind = j.value("bigBlind", config.bigBlind);
    config.startingChips = j.value("startingChips", config.startingChips);
    config.minPlayers = j.value("minPlayers", config.minPlayers);
    config.maxPlayers = j.value("maxPlayers", config.maxPlayers);
    config.seed = j.value("seed", config.seed);
    config.exactCards = j.value("exactCards", config.exactCards);

    if (j.contains("oddChipPolicy")) {
        config.oddChipPolicy = stringToOddChipPolicy(j["oddChipPolicy"].get<std::string>());
    }

    return config;
}

Game::GameConfig JsonSerializer::loadConfigFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open config file: " + path);
    }
    return configFromJson(json::parse(in));
}
