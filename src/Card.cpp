#include "Card.h"
#include <cctype>
#include <stdexcept>

Card::Card(std::string_view str) {
    if (str.length() != 2) {
        throw std::invalid_argument("Card string must be 2 characters: '" + std::string(str) + "'");
    }

    switch (std::toupper(static_cast<unsigned char>(str[0]))) {
        case '2': rank = Rank::TWO; break;
        case '3': rank = Rank::THREE; break;
        case '4': rank = Rank::FOUR; break;
        case '5': rank = Rank::FIVE; break;
        case '6': rank = Rank::SIX; break;
        case '7': rank = Rank::SEVEN; break;
        case '8': rank = Rank::EIGHT; break;
        case '9': rank = Rank::NINE; break;
        case 'T': rank = Rank::TEN; break;
        case 'J': rank = Rank::JACK; break;
        case 'Q': rank = Rank::QUEEN; break;
        case 'K': rank = Rank::KING; break;
        case 'A': rank = Rank::ACE; break;
        default: throw std::invalid_argument("Invalid rank: " + std::string(1, str[0]));
    }

    switch (str[1]) {
        case 'C': case 'c': suit = Suit::CLUBS; break;
        case 'D': case 'd': suit = Suit::DIAMONDS; break;
        case 'H': case 'h': suit = Suit::HEARTS; break;
        case 'S': case 's': suit = Suit::SPADES; break;
        default: throw std::invalid_argument("Invalid suit: " + std::string(1, str[1]));
    }
}

char Card::rankChar(int rankValue) {
    static constexpr const char rankChars[] = "??23456789TJQKA";
    if (rankValue < kMinRank || rankValue > kMaxRank) {
        return '?';
    }
    return rankChars[rankValue];
}

std::string Card::rankName(int rankValue) {
    static constexpr const char* const names[] = {
        "Two", "Three", "Four", "Five", "Six", "Seven", "Eight",
        "Nine", "Ten", "Jack", "Queen", "King", "Ace"
    };
    if (rankValue < kMinRank || rankValue > kMaxRank) {
        return "Unknown";
    }
    return names[rankValue - kMinRank];
}

std::string Card::toString() const {
    static constexpr const char suitChars[] = "CDHS";

    std::string result;
    result.reserve(2);
    result += rankChar(getRankValue());
    result += suitChars[getSuitValue()];
    return result;
}

std::string Card::toDisplayString() const {
    return std::string(1, rankChar(getRankValue())) + getSuitSymbol();
}

std::string Card::getSuitSymbol() const {
    static constexpr const char* const suitSymbols[] = {"♣", "♦", "♥", "♠"};
    return suitSymbols[getSuitValue()];
}

std::vector<Card> parseCards(std::string_view text) {
    std::vector<Card> cards;
    size_t i = 0;
    while (i < text.size()) {
        const unsigned char c = static_cast<unsigned char>(text[i]);
        if (std::isspace(c) || c == ',') {
            ++i;
            continue;
        }
        size_t end = i;
        while (end < text.size() && !std::isspace(static_cast<unsigned char>(text[end])) &&
               text[end] != ',') {
            ++end;
        }
        cards.emplace_back(text.substr(i, end - i));
        i = end;
    }
    return cards;
}

std::string cardsToString(const std::vector<Card>& cards) {
    std::string out;
    for (const auto& card : cards) {
        if (!out.empty()) {
            out += ' ';
        }
        out += card.toString();
    }
    return out;
}
