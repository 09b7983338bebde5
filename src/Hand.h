#ifndef HAND_H
#define HAND_H

#include "Card.h"
#include <vector>
#include <map>
#include <string>

/**
 * Evaluates poker hands and compares them.
 * Accepts 5 to 7 cards and picks the best five-card hand.
 */
class Hand {
public:
    enum class Ranking {
        HIGH_CARD = 0,
        ONE_PAIR,
        TWO_PAIR,
        THREE_OF_A_KIND,
        STRAIGHT,
        FLUSH,
        FULL_HOUSE,
        FOUR_OF_A_KIND,
        STRAIGHT_FLUSH
    };

    /**
     * Totally ordered hand strength: category first, then tiebreakers
     * (rank values, most significant first). Equal values are a split.
     */
    struct EvaluatedHand {
        Ranking ranking;
        std::vector<int> tiebreakers;
        std::vector<Card> bestFive;   // The best 5 cards that make this hand

        EvaluatedHand() : ranking(Ranking::HIGH_CARD) {}

        /**
         * > 0 if this hand wins, < 0 if other wins, 0 on an exact tie
         */
        int compare(const EvaluatedHand& other) const;

        bool operator>(const EvaluatedHand& other) const {
            return compare(other) > 0;
        }

        bool operator<(const EvaluatedHand& other) const {
            return compare(other) < 0;
        }

        bool operator==(const EvaluatedHand& other) const {
            return compare(other) == 0;
        }

        bool operator!=(const EvaluatedHand& other) const {
            return compare(other) != 0;
        }

        /**
         * Category name; an ace-high straight flush reads "Royal Flush"
         */
        std::string getRankingName() const;

        /**
         * Full description, e.g. "Full House, Kings full of Twos"
         */
        std::string describe() const;
    };

private:
    static std::map<int, int> countRanks(const std::vector<Card>& cards);

    static bool isFlush(const std::vector<Card>& cards);

    /**
     * Checks five distinct ranks for a straight. Sets highCard to the top
     * of the straight (5 for A-2-3-4-5).
     */
    static bool isStraight(const std::vector<int>& ranks, int& highCard);

    static EvaluatedHand evaluateFive(const std::vector<Card>& fiveCards);

public:
    static constexpr size_t kMinCards = 5;
    static constexpr size_t kMaxCards = 7;

    /**
     * Evaluates the best 5-card hand out of 5-7 cards. Throws
     * std::invalid_argument on a bad card count or duplicated cards.
     */
    [[nodiscard]] static EvaluatedHand evaluate(const std::vector<Card>& cards);

    /**
     * Evaluates hole cards together with community cards
     */
    [[nodiscard]] static EvaluatedHand evaluate(const std::vector<Card>& holeCards,
                                                const std::vector<Card>& communityCards);
};

#endif // HAND_H
