#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <nlohmann/json.hpp>
#include "Game.h"
#include "Hand.h"
#include "JsonSerializer.h"
#include "PokerErrors.h"

namespace py = pybind11;

// Helper to convert nlohmann::json to py::object
py::object json_to_py(const nlohmann::json& j) {
    if (j.is_null()) {
        return py::none();
    } else if (j.is_boolean()) {
        return py::bool_(j.get<bool>());
    } else if (j.is_number_unsigned()) {
        return py::int_(j.get<nlohmann::json::number_unsigned_t>());
    } else if (j.is_number_integer()) {
        // nlohmann::json::number_integer_t is usually long long
        return py::int_(j.get<nlohmann::json::number_integer_t>());
    } else if (j.is_number_float()) {
        return py::float_(j.get<double>());
    } else if (j.is_string()) {
        return py::str(j.get<std::string>());
    } else if (j.is_array()) {
        py::list l;
        for (const auto& item : j) {
            l.append(json_to_py(item));
        }
        return l;
    } else if (j.is_object()) {
        py::dict d;
        for (auto it = j.begin(); it != j.end(); ++it) {
            d[py::str(it.key())] = json_to_py(it.value());
        }
        return d;
    }
    return py::none();
}

// Snapshot for one viewer as dict (avoids string parsing in Python)
py::dict get_snapshot_dict(const Game& game, const std::string& viewerId) {
    auto j = JsonSerializer::snapshotToJson(game.snapshot(viewerId));
    return json_to_py(j).cast<py::dict>();
}

std::string get_snapshot_json(const Game& game, const std::string& viewerId) {
    return JsonSerializer::snapshotToJson(game.snapshot(viewerId)).dump();
}

py::object get_last_result_dict(const Game& game) {
    const auto& result = game.getLastResult();
    if (!result) {
        return py::none();
    }
    return json_to_py(JsonSerializer::handResultToJson(*result));
}

// Helper to process action via string ("fold", "raise", ...)
void process_action_str(Game& game, const std::string& playerId, const std::string& actionStr, int amount) {
    Player::Action action = JsonSerializer::stringToAction(actionStr);
    if (action == Player::Action::NONE) {
        throw IllegalActionError(IllegalActionError::Reason::INVALID_ACTION,
            "Unknown action: " + actionStr);
    }
    game.processAction(playerId, action, amount);
}

// Evaluates 5-7 cards given as strings, returns (category, description)
py::tuple evaluate_hand(const std::vector<std::string>& cards) {
    std::vector<Card> parsed;
    parsed.reserve(cards.size());
    for (const auto& text : cards) {
        parsed.emplace_back(text);
    }
    const auto evaluated = Hand::evaluate(parsed);
    return py::make_tuple(evaluated.getRankingName(), evaluated.describe());
}

PYBIND11_MODULE(holdem_py, m) {
    m.doc() = "Texas Hold'em engine bindings";

    // IllegalActionError is recoverable: the same player should be asked again.
    // The violated constraint is available as `reason` ("below_minimum_raise", ...)
    static py::exception<IllegalActionError> illegalActionType(m, "IllegalActionError", PyExc_ValueError);
    py::register_exception_translator([](std::exception_ptr p) {
        try {
            if (p) {
                std::rethrow_exception(p);
            }
        } catch (const IllegalActionError& e) {
            py::object instance = illegalActionType(e.what());
            instance.attr("reason") = reasonToString(e.reason());
            PyErr_SetObject(illegalActionType.ptr(), instance.ptr());
        }
    });

    // GameConfig binding
    py::class_<Game::GameConfig>(m, "GameConfig")
        .def(py::init<>())
        .def_readwrite("smallBlind", &Game::GameConfig::smallBlind)
        .def_readwrite("bigBlind", &Game::GameConfig::bigBlind)
        .def_readwrite("startingChips", &Game::GameConfig::startingChips)
        .def_readwrite("minPlayers", &Game::GameConfig::minPlayers)
        .def_readwrite("maxPlayers", &Game::GameConfig::maxPlayers)
        .def_readwrite("seed", &Game::GameConfig::seed)
        .def_readwrite("exactCards", &Game::GameConfig::exactCards)
        .def_property("oddChipPolicy",
            [](const Game::GameConfig& self) {
                return JsonSerializer::oddChipPolicyToString(self.oddChipPolicy);
            },
            [](Game::GameConfig& self, const std::string& policy) {
                self.oddChipPolicy = JsonSerializer::stringToOddChipPolicy(policy);
            });

    // Game binding
    py::class_<Game>(m, "Game")
        .def(py::init<const Game::GameConfig&>(), py::arg("config") = Game::GameConfig())
        .def("add_player", [](Game& self, const std::string& id, const std::string& name, int chips) {
            return self.addPlayer(id, name, chips);
        }, py::arg("id"), py::arg("name"), py::arg("chips") = 0)
        .def("remove_player", [](Game& self, const std::string& id) {
            return self.removePlayer(id);
        })
        .def("sit_out", [](Game& self, const std::string& id) { return self.sitOut(id); })
        .def("sit_in", [](Game& self, const std::string& id) { return self.sitIn(id); })
        .def("start_hand", &Game::startHand)
        .def("process_action", &process_action_str, py::arg("player_id"), py::arg("action"), py::arg("amount") = 0)
        .def("forfeit_current_action", &Game::forfeitCurrentAction)
        .def("abort_hand", &Game::abortHand, py::arg("reason"))
        .def("is_hand_in_progress", &Game::isHandInProgress)
        .def("get_stage_name", &Game::getStageName)
        .def("get_hand_number", &Game::getHandNumber)
        .def("get_seed", &Game::getSeed)
        .def("get_snapshot_json", &get_snapshot_json, py::arg("viewer_id") = "")
        .def("get_snapshot_dict", &get_snapshot_dict, py::arg("viewer_id") = "",
             "Table snapshot as a Python dictionary (faster than parsing JSON string)")
        .def("get_last_result_dict", &get_last_result_dict)
        .def("get_action_constraints", [](const Game& self) {
            return json_to_py(JsonSerializer::constraintsToJson(self.getActionConstraints()));
        })
        .def("get_current_player_id", [](const Game& self) -> std::optional<std::string> {
            const Player* p = self.getCurrentPlayer();
            if (p) return p->getId();
            return std::nullopt;
        });

    m.def("evaluate_hand", &evaluate_hand,
        "Evaluate the best five-card hand from 5-7 cards.\n\n"
        "Args:\n"
        "    cards: List of 5-7 card strings (e.g., ['AS', 'KS', '2H', '5S', '9S'])\n\n"
        "Returns:\n"
        "    tuple: (category name, description)",
        py::arg("cards"));
}
