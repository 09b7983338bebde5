#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>
#include <string>
#include "Game.h"
#include "JsonSerializer.h"
#include "PokerErrors.h"
#include "TextRenderer.h"

/**
 * Hold'em Console Table - Entry Point
 *
 * Seats 2-9 players around one table and plays hands until a single
 * player holds chips. Every decision is read from stdin.
 * Usage: ./holdem [--players N] [--seed S] [--chips C] [--config file.json] [--json]
 */
namespace {

struct Options {
    int players = 0;
    unsigned int seed = 0;
    int chips = 0;
    std::string configPath;
    bool json = false;
};

void printUsage(const char* program) {
    std::cerr << "Usage: " << program
              << " [--players N] [--seed S] [--chips C] [--config file.json] [--json]" << std::endl;
}

bool parseOptions(int argc, char* argv[], Options& options) {
    for (int i = 1; i < argc; i++) {
        const bool hasValue = i + 1 < argc;
        if (std::strcmp(argv[i], "--players") == 0 && hasValue) {
            options.players = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--seed") == 0 && hasValue) {
            options.seed = static_cast<unsigned int>(std::strtoul(argv[++i], nullptr, 10));
        } else if (std::strcmp(argv[i], "--chips") == 0 && hasValue) {
            options.chips = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--config") == 0 && hasValue) {
            options.configPath = argv[++i];
        } else if (std::strcmp(argv[i], "--json") == 0) {
            options.json = true;
        } else {
            return false;
        }
    }
    return true;
}

// "raise 120", "all-in", "CALL" ...
bool parseDecision(const std::string& line, Player::Action& action, int& amount) {
    std::istringstream in(line);
    std::string word;
    if (!(in >> word)) {
        return false;
    }

    std::transform(word.begin(), word.end(), word.begin(), [](unsigned char c) {
        return c == '-' ? '_' : static_cast<char>(std::tolower(c));
    });
    action = JsonSerializer::stringToAction(word);
    if (action == Player::Action::NONE) {
        return false;
    }

    amount = 0;
    if (action == Player::Action::BET || action == Player::Action::RAISE) {
        if (!(in >> amount)) {
            return false;
        }
    }
    return true;
}

// Prints history entries recorded since the last call
void printNewEvents(const Game& game, const TextRenderer& renderer, size_t& printed) {
    const auto view = game.snapshot();
    for (; printed < view.history.size(); printed++) {
        const std::string line = renderer.renderEvent(view.history[printed]);
        if (!line.empty()) {
            std::cout << line << std::endl;
        }
    }
}

int readPlayerCount() {
    std::cout << "Enter the number of players (2-9): ";
    std::string line;
    if (!std::getline(std::cin, line)) {
        return 0;
    }
    return std::atoi(line.c_str());
}

} // namespace

int main(int argc, char* argv[]) {
    Options options;
    if (!parseOptions(argc, argv, options)) {
        printUsage(argv[0]);
        return 2;
    }

    try {
        Game::GameConfig config;
        if (!options.configPath.empty()) {
            config = JsonSerializer::loadConfigFile(options.configPath);
        }
        if (options.seed != 0) {
            config.seed = options.seed;
        }
        if (options.chips > 0) {
            config.startingChips = options.chips;
        }

        int playerCount = options.players > 0 ? options.players : readPlayerCount();
        if (playerCount < 2 || playerCount > config.maxPlayers) {
            std::cerr << "Player count must be between 2 and " << config.maxPlayers << std::endl;
            return 2;
        }

        Game game(config);
        TextRenderer renderer;
        for (int i = 1; i <= playerCount; i++) {
            const std::string id = "p" + std::to_string(i);
            if (!game.addPlayer(id, "Player " + std::to_string(i))) {
                std::cerr << "Could not seat " << id << std::endl;
                return 1;
            }
        }
        renderer.learnNames(game.snapshot());

        std::cout << "Seed: " << game.getSeed() << std::endl;

        while (game.countPlayersWithChips() > 1) {
            if (!game.startHand()) {
                break;
            }

            std::cout << "+++++++++++++" << std::endl;
            std::cout << "Hand: " << game.getHandNumber() << std::endl;
            std::cout << "+++++++++++++" << std::endl;

            size_t printed = 0;
            printNewEvents(game, renderer, printed);

            while (game.isHandInProgress()) {
                const Player* current = game.getCurrentPlayer();
                if (!current) {
                    break;
                }
                const std::string playerId = current->getId();

                std::cout << TextRenderer::renderTable(game.snapshot(playerId));
                std::cout << renderer.getPlayerName(playerId) << "'s cards: "
                          << TextRenderer::renderCards(current->getHoleCards()) << std::endl;
                std::cout << renderer.renderPrompt(playerId, game.getActionConstraints(),
                                                   game.getPotSize()) << std::endl;
                std::cout << "> " << std::flush;

                std::string line;
                if (!std::getline(std::cin, line)) {
                    std::cout << std::endl << "End of input, leaving the table." << std::endl;
                    if (game.abortHand("Input closed")) {
                        std::cout << renderer.renderResult(*game.getLastResult());
                    }
                    return 0;
                }

                Player::Action action;
                int amount = 0;
                if (!parseDecision(line, action, amount)) {
                    std::cout << "Enter one of: fold, check, call, bet <to>, raise <to>, all_in" << std::endl;
                    continue;
                }

                try {
                    game.processAction(playerId, action, amount);
                } catch (const IllegalActionError& e) {
                    if (options.json) {
                        std::cout << JsonSerializer::illegalActionToJson(e).dump() << std::endl;
                    } else {
                        std::cout << "Illegal action (" << reasonToString(e.reason()) << "): "
                                  << e.what() << std::endl;
                    }
                    continue;
                }

                printNewEvents(game, renderer, printed);
            }

            const auto& result = game.getLastResult();
            if (result) {
                std::cout << TextRenderer::renderTable(game.snapshot());
                std::cout << renderer.renderResult(*result);
                if (options.json) {
                    std::cout << JsonSerializer::handResultToJson(*result).dump() << std::endl;
                }
            }
        }

        for (const Player* player : game.getPlayers()) {
            if (player->getChips() > 0) {
                std::cout << player->getName() << " finishes with " << player->getChips()
                          << " chips" << std::endl;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
