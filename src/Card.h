#ifndef CARD_H
#define CARD_H

#include <string>
#include <string_view>
#include <vector>

/**
 * A single playing card. Immutable value type; rank 2-14 (Ace high) and
 * one of four suits.
 */
class Card {
public:
    enum class Rank {
        TWO = 2, THREE, FOUR, FIVE, SIX, SEVEN, EIGHT, NINE, TEN,
        JACK, QUEEN, KING, ACE
    };

    enum class Suit {
        CLUBS = 0, DIAMONDS, HEARTS, SPADES
    };

    static constexpr int kSuitCount = 4;
    static constexpr int kMinRank = 2;
    static constexpr int kMaxRank = 14;
    static constexpr int kDeckSize = 52;

private:
    Rank rank;
    Suit suit;

public:
    Card() : rank(Rank::TWO), suit(Suit::CLUBS) {}

    Card(Rank r, Suit s) : rank(r), suit(s) {}

    /**
     * Parses "AS", "7h", "TD" ...
     * Format: [Rank][Suit] where Rank is 2-9,T,J,Q,K,A and Suit is C,D,H,S.
     * Throws std::invalid_argument on anything else.
     */
    explicit Card(std::string_view str);

    Rank getRank() const noexcept { return rank; }
    Suit getSuit() const noexcept { return suit; }

    int getRankValue() const noexcept { return static_cast<int>(rank); }
    int getSuitValue() const noexcept { return static_cast<int>(suit); }

    /**
     * Dense index in [0, 52), suit-major.
     */
    int index() const noexcept {
        return getSuitValue() * 13 + (getRankValue() - kMinRank);
    }

    std::string toString() const;

    /**
     * Rank followed by the Unicode suit symbol, e.g. "A♠"
     */
    std::string toDisplayString() const;

    std::string getSuitSymbol() const;

    /**
     * Single rank character ('2'..'9', 'T', 'J', 'Q', 'K', 'A')
     */
    static char rankChar(int rankValue);

    /**
     * Long rank name used in hand descriptions ("Ace", "Seven", ...)
     */
    static std::string rankName(int rankValue);

    bool operator==(const Card& other) const noexcept {
        return rank == other.rank && suit == other.suit;
    }

    bool operator!=(const Card& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const Card& other) const noexcept {
        if (rank != other.rank) {
            return rank < other.rank;
        }
        return suit < other.suit;
    }
};

/**
 * Parses a whitespace or comma separated list such as "AS KS 2h".
 */
[[nodiscard]] std::vector<Card> parseCards(std::string_view text);

std::string cardsToString(const std::vector<Card>& cards);

#endif // CARD_H
