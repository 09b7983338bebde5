#include <iostream>
#include <cassert>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include "JsonSerializer.h"
#include "Game.h"

void testActionNames() {
    std::cout << "Testing action names..." << std::endl;

    const Player::Action actions[] = {
        Player::Action::FOLD, Player::Action::CHECK, Player::Action::CALL,
        Player::Action::BET, Player::Action::RAISE, Player::Action::ALL_IN
    };
    for (auto action : actions) {
        assert(JsonSerializer::stringToAction(JsonSerializer::actionToString(action)) == action);
    }

    assert(JsonSerializer::actionToString(Player::Action::ALL_IN) == "all_in");
    assert(JsonSerializer::stringToAction("shove") == Player::Action::NONE);
    assert(JsonSerializer::stateToString(Player::State::SITTING_OUT) == "sitting_out");
    assert(JsonSerializer::eventTypeToString(GameEvent::Type::POT_AWARDED) == "pot_awarded");

    std::cout << "  ✓ Action, state and event names" << std::endl;
}

void testConfigFromJson() {
    std::cout << "Testing config loading..." << std::endl;

    json j = {
        {"smallBlind", 25},
        {"bigBlind", 50},
        {"seed", 7},
        {"exactCards", {"AS", "KS"}},
        {"oddChipPolicy", "spread_left_of_dealer"}
    };
    auto config = JsonSerializer::configFromJson(j);
    assert(config.smallBlind == 25);
    assert(config.bigBlind == 50);
    assert(config.seed == 7);
    assert(config.startingChips == 1000);   // Default kept
    assert(config.maxPlayers == 9);
    assert(config.exactCards.size() == 2);
    assert(config.oddChipPolicy == Pot::OddChipPolicy::SPREAD_LEFT_OF_DEALER);

    auto back = JsonSerializer::configToJson(config);
    assert(back["bigBlind"] == 50);
    assert(back["oddChipPolicy"] == "spread_left_of_dealer");

    bool threw = false;
    try {
        (void)JsonSerializer::configFromJson(json{{"oddChipPolicy", "to_the_house"}});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  ✓ Config keys read with defaults for the rest" << std::endl;
}

void testConfigFile() {
    std::cout << "Testing config file..." << std::endl;

    const std::string path = "holdem_test_config.json";
    {
        std::ofstream out(path);
        out << R"({"startingChips": 2500, "maxPlayers": 6})";
    }
    auto config = JsonSerializer::loadConfigFile(path);
    std::remove(path.c_str());
    assert(config.startingChips == 2500);
    assert(config.maxPlayers == 6);

    bool threw = false;
    try {
        (void)JsonSerializer::loadConfigFile("does/not/exist.json");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  ✓ Config file parsed, missing file reported" << std::endl;
}

void testSnapshotJson() {
    std::cout << "Testing snapshot serialization..." << std::endl;

    Game::GameConfig config;
    config.seed = 5;
    config.exactCards = {"QH", "QD", "AS", "KS"};
    Game game(config);
    assert(game.addPlayer("alice", "Alice"));
    assert(game.addPlayer("bob", "Bob"));
    assert(game.startHand());

    json j = JsonSerializer::snapshotToJson(game.snapshot("alice"));
    assert(j["stage"] == "PreflopBetting");
    assert(j["handNumber"] == 1);
    assert(j["currentPlayerId"] == "alice");
    assert(j["totalPot"] == 30);
    assert(j["board"].empty());
    assert(j["players"].size() == 2);
    assert(j["players"][0]["holeCards"] == json::array({"AS", "KS"}));
    assert(j["players"][1]["holeCards"].is_null());
    assert(j["players"][0]["state"] == "active");
    assert(j["history"][0]["type"] == "hand_started");

    // Bob's hole cards do not leak through the history either
    for (const auto& event : j["history"]) {
        if (event["type"] == "hole_cards_dealt" && event["playerId"] == "bob") {
            assert(!event.contains("cards"));
        }
    }

    json c = JsonSerializer::constraintsToJson(game.getActionConstraints());
    assert(c["canAct"] == true);
    assert(c["toCall"] == 10);
    assert(c["minRaiseTo"] == 40);
    assert(c["legalActions"][0] == "fold");

    std::cout << "  ✓ Snapshot JSON hides other players' cards" << std::endl;
}

void testHandResultJson() {
    std::cout << "Testing hand result serialization..." << std::endl;

    Game::GameConfig config;
    config.seed = 5;
    Game game(config);
    assert(game.addPlayer("alice", "Alice"));
    assert(game.addPlayer("bob", "Bob"));
    assert(game.startHand());
    game.processAction("alice", Player::Action::FOLD);

    const auto& result = game.getLastResult();
    assert(result);
    json j = JsonSerializer::handResultToJson(*result);
    assert(j["showdown"] == false);
    assert(j["aborted"] == false);
    assert(!j.contains("abortReason"));
    assert(j["payouts"]["bob"] == 30);
    assert(j["finalStacks"]["alice"] == 990);
    assert(j["pots"].size() == 1);
    assert(j["pots"][0]["winnerIds"] == json::array({"bob"}));
    assert(j["hands"].empty());

    json event = JsonSerializer::eventToJson(game.getHistory().back());
    assert(event["type"] == "pot_awarded");
    assert(event["amount"] == 30);

    std::cout << "  ✓ Hand result JSON carries pots, payouts and stacks" << std::endl;
}

void testIllegalActionJson() {
    std::cout << "Testing illegal action serialization..." << std::endl;

    Game::GameConfig config;
    config.seed = 5;
    Game game(config);
    assert(game.addPlayer("alice", "Alice"));
    assert(game.addPlayer("bob", "Bob"));
    assert(game.addPlayer("carol", "Carol"));
    assert(game.startHand());

    bool threw = false;
    try {
        game.processAction("alice", Player::Action::RAISE, 25);
    } catch (const IllegalActionError& e) {
        threw = true;
        json j = JsonSerializer::illegalActionToJson(e);
        assert(j["error"] == "illegal_action");
        assert(j["reason"] == "below_minimum_raise");
        assert(j["message"] == std::string(e.what()));
    }
    assert(threw);

    assert(std::string(reasonToString(IllegalActionError::Reason::NOT_YOUR_TURN)) == "not_your_turn");
    assert(std::string(reasonToString(IllegalActionError::Reason::BETTING_NOT_REOPENED)) ==
           "betting_not_reopened");

    std::cout << "  ✓ Rejected action carries its reason code" << std::endl;
}

int main() {
    std::cout << "\n📦 JSON Serializer Test Suite" << std::endl;
    std::cout << "=============================" << std::endl;

    try {
        testActionNames();
        testConfigFromJson();
        testConfigFile();
        testSnapshotJson();
        testHandResultJson();
        testIllegalActionJson();

        std::cout << "\n✅ All JSON Serializer tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\n❌ Test failed with error: " << e.what() << std::endl;
        return 1;
    }
}
