#include "TextRenderer.h"
#include <algorithm>
#include <sstream>
#include <vector>

namespace {
// Slot of the i-th seated player on the oval, top row first
constexpr int seatPositions[TextRenderer::kDisplaySeats] = {4, 0, 1, 3, 8, 2, 7, 6, 5};
constexpr size_t kBoxInnerWidth = 38;
}

void TextRenderer::setPlayerName(const std::string& playerId, const std::string& name) {
    playerNames[playerId] = name;
}

std::string TextRenderer::getPlayerName(const std::string& playerId) const {
    auto it = playerNames.find(playerId);
    if (it != playerNames.end()) {
        return it->second;
    }
    return playerId;
}

void TextRenderer::learnNames(const TableSnapshot& snapshot) {
    for (const auto& player : snapshot.players) {
        setPlayerName(player.id, player.name);
    }
}

size_t TextRenderer::displayWidth(std::string_view text) {
    // Count UTF-8 code points; suit symbols and box drawing are one column each
    size_t width = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) {
            width++;
        }
    }
    return width;
}

std::string TextRenderer::padRight(const std::string& text, size_t width) {
    const size_t w = displayWidth(text);
    return w >= width ? text : text + std::string(width - w, ' ');
}

std::string TextRenderer::padLeft(const std::string& text, size_t width) {
    const size_t w = displayWidth(text);
    return w >= width ? text : std::string(width - w, ' ') + text;
}

std::string TextRenderer::center(const std::string& text, size_t width) {
    const size_t w = displayWidth(text);
    if (w >= width) {
        return text;
    }
    const size_t left = (width - w) / 2;
    return std::string(left, ' ') + text + std::string(width - w - left, ' ');
}

std::string TextRenderer::renderCards(const std::vector<Card>& cards) {
    std::string result;
    for (const auto& card : cards) {
        if (!result.empty()) {
            result += ' ';
        }
        result += card.toDisplayString();
    }
    return result;
}

std::string TextRenderer::renderAction(Player::Action action) {
    switch (action) {
        case Player::Action::FOLD: return "folds";
        case Player::Action::CHECK: return "checks";
        case Player::Action::CALL: return "calls";
        case Player::Action::BET: return "bets";
        case Player::Action::RAISE: return "raises to";
        case Player::Action::ALL_IN: return "is all-in for";
        default: return "waits";
    }
}

std::string TextRenderer::renderTable(const TableSnapshot& snapshot) {
    std::string slots[kDisplaySeats];
    const size_t shown = std::min(snapshot.players.size(), static_cast<size_t>(kDisplaySeats));

    for (size_t i = 0; i < shown; i++) {
        const auto& player = snapshot.players[i];
        std::string display = player.name + " ($" + std::to_string(player.chips) + ")";
        if (player.isDealer) {
            display += " [D]";
        }
        if (player.isSmallBlind) {
            display += " [SB]";
        }
        if (player.isBigBlind) {
            display += " [BB]";
        }
        if (player.state == Player::State::FOLDED) {
            display += " (Folded)";
        } else if (player.state == Player::State::ALL_IN) {
            display += " (All-in)";
        } else if (player.state == Player::State::SITTING_OUT) {
            display += " (Sitting out)";
        }
        slots[seatPositions[i]] = std::move(display);
    }

    const std::string board = snapshot.board.empty() ? "---" : renderCards(snapshot.board);

    std::string rule;
    for (size_t i = 0; i < kBoxInnerWidth; i++) {
        rule += "─";
    }

    std::ostringstream out;
    out << std::string(kTableWidth, '=') << '\n';
    out << center(slots[0], kTableWidth) << '\n';
    out << padRight(slots[1], 25) << std::string(10, ' ') << padLeft(slots[2], 25) << '\n';
    out << '\n';
    out << padRight(slots[3], 15) << std::string(30, ' ') << padLeft(slots[4], 15) << '\n';
    out << center("╭" + rule + "╮", kTableWidth) << '\n';
    out << center("│" + padRight("  Board: " + board, kBoxInnerWidth) + "│", kTableWidth) << '\n';
    out << center("│" + padRight("  Pot: $" + std::to_string(snapshot.totalPot), kBoxInnerWidth) + "│",
                  kTableWidth) << '\n';
    out << center("╰" + rule + "╯", kTableWidth) << '\n';
    out << padRight(slots[5], 15) << std::string(30, ' ') << padLeft(slots[6], 15) << '\n';
    out << '\n';
    out << padRight(slots[7], 25) << std::string(10, ' ') << padLeft(slots[8], 25) << '\n';
    out << std::string(kTableWidth, ' ') << '\n';
    out << std::string(kTableWidth, '=') << '\n';
    return out.str();
}

std::string TextRenderer::renderPrompt(const std::string& playerId,
                                       const BettingRound::ActionConstraints& constraints,
                                       int pot) const {
    const std::string name = getPlayerName(playerId);
    std::ostringstream out;
    out << name << "'s turn. Current bet: " << constraints.currentBet
        << ". Pot: " << pot
        << ". You need to call: " << constraints.toCall << '\n';

    std::vector<std::string> options;
    bool canFold = false;
    bool canAllIn = false;
    for (auto action : constraints.legalActions) {
        switch (action) {
            case Player::Action::CHECK:
                options.push_back("Check");
                break;
            case Player::Action::CALL:
                options.push_back("Call (" + std::to_string(constraints.toCall) + ")");
                break;
            case Player::Action::BET:
            case Player::Action::RAISE:
                options.push_back(std::string(action == Player::Action::BET ? "Bet" : "Raise") +
                    " (to " + std::to_string(constraints.minRaiseTo) + "-" +
                    std::to_string(constraints.maxRaiseTo) + ")");
                break;
            case Player::Action::FOLD:
                canFold = true;
                break;
            case Player::Action::ALL_IN:
                canAllIn = true;
                break;
            default:
                break;
        }
    }
    if (canFold) {
        options.push_back("Fold");
    }
    if (canAllIn) {
        options.push_back("All-In");
    }

    out << name << "'s options: ";
    for (size_t i = 0; i < options.size(); i++) {
        out << (i ? ", " : "") << options[i];
    }
    return out.str();
}

std::string TextRenderer::renderEvent(const GameEvent& event) const {
    const std::string name = getPlayerName(event.playerId);

    switch (event.type) {
        case GameEvent::Type::HAND_STARTED:
            return "Hand #" + std::to_string(event.handNumber) + " (" + name + " has the button)";

        case GameEvent::Type::BLIND_POSTED:
            return name + " posts " + event.detail + " blind " + std::to_string(event.amount);

        case GameEvent::Type::HOLE_CARDS_DEALT:
            if (event.cards.empty()) {
                return "";
            }
            return name + " is dealt " + renderCards(event.cards);

        case GameEvent::Type::PLAYER_ACTION:
            switch (event.action) {
                case Player::Action::FOLD:
                case Player::Action::CHECK:
                    return name + " " + renderAction(event.action);
                case Player::Action::CALL:
                case Player::Action::BET:
                    return name + " " + renderAction(event.action) + " " + std::to_string(event.amount);
                default:
                    return name + " " + renderAction(event.action) + " " + std::to_string(event.total);
            }

        case GameEvent::Type::BOARD_DEALT:
            return "--- " + event.detail + " --- " + renderCards(event.cards);

        case GameEvent::Type::SHOWDOWN:
            return name + " shows " + renderCards(event.cards) + " (" + event.detail + ")";

        case GameEvent::Type::POT_AWARDED:
            return name + " wins " + std::to_string(event.amount) + " from the " + event.detail;

        case GameEvent::Type::HAND_ABORTED:
            return "Hand aborted: " + event.detail;
    }
    return "";
}

std::string TextRenderer::joinNames(const std::vector<std::string>& ids) const {
    std::string joined;
    for (size_t i = 0; i < ids.size(); i++) {
        if (i) {
            joined += ", ";
        }
        joined += getPlayerName(ids[i]);
    }
    return joined;
}

std::string TextRenderer::renderResult(const HandResult& result) const {
    std::ostringstream out;

    if (result.aborted) {
        out << "Hand #" << result.handNumber << " aborted: " << result.abortReason
            << " (stacks restored)\n";
        return out.str();
    }

    for (const auto& hand : result.hands) {
        out << getPlayerName(hand.playerId) << ": " << hand.description
            << " [" << renderCards(hand.bestFive) << "]\n";
    }

    for (size_t i = 0; i < result.tiers.size(); i++) {
        const auto& tier = result.tiers[i];
        if (result.tiers.size() > 1) {
            out << (i == 0 ? std::string("Main pot") : "Side pot " + std::to_string(i))
                << " ($" << tier.amount << "): ";
        }
        if (tier.winnerIds.size() == 1) {
            out << "Winner is " << getPlayerName(tier.winnerIds.front()) << '\n';
        } else if (tier.winnerIds.empty()) {
            out << "No winner\n";
        } else {
            out << "Chopped pot between: " << joinNames(tier.winnerIds) << '\n';
        }
    }

    return out.str();
}
