#include "Hand.h"
#include <algorithm>
#include <array>
#include <functional>
#include <optional>
#include <stdexcept>

namespace {

std::string plural(int rankValue) {
    if (rankValue == 6) {
        return "Sixes";
    }
    return Card::rankName(rankValue) + "s";
}

} // namespace

int Hand::EvaluatedHand::compare(const EvaluatedHand& other) const {
    if (ranking != other.ranking) {
        return static_cast<int>(ranking) - static_cast<int>(other.ranking);
    }

    const size_t n = std::min(tiebreakers.size(), other.tiebreakers.size());
    for (size_t i = 0; i < n; i++) {
        if (tiebreakers[i] != other.tiebreakers[i]) {
            return tiebreakers[i] - other.tiebreakers[i];
        }
    }

    return 0; // Exact tie
}

std::string Hand::EvaluatedHand::getRankingName() const {
    static constexpr const char* const rankingNames[] = {
        "High Card",
        "One Pair",
        "Two Pair",
        "Three of a Kind",
        "Straight",
        "Flush",
        "Full House",
        "Four of a Kind",
        "Straight Flush"
    };
    static constexpr size_t nameCount = sizeof(rankingNames) / sizeof(rankingNames[0]);

    if (ranking == Ranking::STRAIGHT_FLUSH && !tiebreakers.empty() && tiebreakers[0] == Card::kMaxRank) {
        return "Royal Flush";
    }

    const auto idx = static_cast<size_t>(ranking);
    if (idx < nameCount) {
        return rankingNames[idx];
    }
    return "Unknown";
}

std::string Hand::EvaluatedHand::describe() const {
    const std::string name = getRankingName();
    if (tiebreakers.empty()) {
        return name;
    }

    switch (ranking) {
        case Ranking::STRAIGHT_FLUSH:
            if (name == "Royal Flush") {
                return name;
            }
            return name + ", " + Card::rankName(tiebreakers[0]) + " high";
        case Ranking::FOUR_OF_A_KIND:
        case Ranking::THREE_OF_A_KIND:
        case Ranking::ONE_PAIR:
            return name + ", " + plural(tiebreakers[0]);
        case Ranking::FULL_HOUSE:
            return name + ", " + plural(tiebreakers[0]) + " full of " + plural(tiebreakers[1]);
        case Ranking::TWO_PAIR:
            return name + ", " + plural(tiebreakers[0]) + " and " + plural(tiebreakers[1]);
        case Ranking::FLUSH:
        case Ranking::STRAIGHT:
            return name + ", " + Card::rankName(tiebreakers[0]) + " high";
        case Ranking::HIGH_CARD:
            return name + ", " + Card::rankName(tiebreakers[0]);
    }
    return name;
}

std::map<int, int> Hand::countRanks(const std::vector<Card>& cards) {
    std::map<int, int> counts;
    for (const auto& card : cards) {
        ++counts[card.getRankValue()];
    }
    return counts;
}

bool Hand::isFlush(const std::vector<Card>& cards) {
    return std::all_of(cards.begin(), cards.end(), [&](const Card& c) {
        return c.getSuit() == cards.front().getSuit();
    });
}

bool Hand::isStraight(const std::vector<int>& ranks, int& highCard) {
    std::vector<int> uniqueRanks = ranks;
    std::sort(uniqueRanks.begin(), uniqueRanks.end(), std::greater<int>());
    uniqueRanks.erase(std::unique(uniqueRanks.begin(), uniqueRanks.end()), uniqueRanks.end());

    if (uniqueRanks.size() != 5) return false;

    if (uniqueRanks.front() - uniqueRanks.back() == 4) {
        highCard = uniqueRanks.front();
        return true;
    }

    // A-2-3-4-5: the ace plays low and the five is the high card
    static const std::vector<int> wheel = {14, 5, 4, 3, 2};
    if (uniqueRanks == wheel) {
        highCard = 5;
        return true;
    }

    return false;
}

Hand::EvaluatedHand Hand::evaluateFive(const std::vector<Card>& fiveCards) {
    EvaluatedHand result;

    std::vector<int> ranks;
    ranks.reserve(5);
    for (const auto& card : fiveCards) {
        ranks.push_back(card.getRankValue());
    }
    std::sort(ranks.begin(), ranks.end(), std::greater<int>());

    const auto rankCounts = countRanks(fiveCards);
    const bool flush = isFlush(fiveCards);
    int straightHigh = 0;
    const bool straight = isStraight(ranks, straightHigh);

    // Groups ordered by count, then rank, both descending
    std::vector<std::pair<int, int>> groups(rankCounts.begin(), rankCounts.end());
    std::sort(groups.begin(), groups.end(), [](const auto& a, const auto& b) {
        if (a.second != b.second) return a.second > b.second;
        return a.first > b.first;
    });

    // Present the five cards most significant first
    result.bestFive = fiveCards;
    std::sort(result.bestFive.begin(), result.bestFive.end(), [&](const Card& a, const Card& b) {
        const int ca = rankCounts.at(a.getRankValue());
        const int cb = rankCounts.at(b.getRankValue());
        if (ca != cb) return ca > cb;
        if (a.getRankValue() != b.getRankValue()) return a.getRankValue() > b.getRankValue();
        return a.getSuitValue() > b.getSuitValue();
    });
    if (straight && straightHigh == 5) {
        std::rotate(result.bestFive.begin(), result.bestFive.begin() + 1, result.bestFive.end());
    }

    if (flush && straight) {
        result.ranking = Ranking::STRAIGHT_FLUSH;
        result.tiebreakers = {straightHigh};
        return result;
    }

    if (groups[0].second == 4) {
        result.ranking = Ranking::FOUR_OF_A_KIND;
        result.tiebreakers = {groups[0].first, groups[1].first};
        return result;
    }

    if (groups[0].second == 3 && groups[1].second == 2) {
        result.ranking = Ranking::FULL_HOUSE;
        result.tiebreakers = {groups[0].first, groups[1].first};
        return result;
    }

    if (flush) {
        result.ranking = Ranking::FLUSH;
        result.tiebreakers = ranks;
        return result;
    }

    if (straight) {
        result.ranking = Ranking::STRAIGHT;
        result.tiebreakers = {straightHigh};
        return result;
    }

    if (groups[0].second == 3) {
        result.ranking = Ranking::THREE_OF_A_KIND;
        result.tiebreakers = {groups[0].first, groups[1].first, groups[2].first};
        return result;
    }

    if (groups[0].second == 2 && groups[1].second == 2) {
        result.ranking = Ranking::TWO_PAIR;
        result.tiebreakers = {groups[0].first, groups[1].first, groups[2].first};
        return result;
    }

    if (groups[0].second == 2) {
        result.ranking = Ranking::ONE_PAIR;
        result.tiebreakers = {groups[0].first, groups[1].first,
                              groups[2].first, groups[3].first};
        return result;
    }

    result.ranking = Ranking::HIGH_CARD;
    result.tiebreakers = ranks;
    return result;
}

Hand::EvaluatedHand Hand::evaluate(const std::vector<Card>& cards) {
    if (cards.size() < kMinCards || cards.size() > kMaxCards) {
        throw std::invalid_argument("Hand evaluation needs 5 to 7 cards, got " +
                                    std::to_string(cards.size()));
    }

    std::array<bool, Card::kDeckSize> seen{};
    for (const auto& card : cards) {
        if (seen[card.index()]) {
            throw std::invalid_argument("Duplicate card in hand: " + card.toString());
        }
        seen[card.index()] = true;
    }

    if (cards.size() == kMinCards) {
        return evaluateFive(cards);
    }

    // Every 5-card subset: C(6,5) = 6 or C(7,5) = 21 combinations
    std::optional<EvaluatedHand> bestHand;
    const size_t n = cards.size();
    std::vector<Card> fiveCards;
    fiveCards.reserve(5);

    std::function<void(size_t, size_t)> generateCombinations = [&](size_t start, size_t chosen) {
        if (chosen == 5) {
            EvaluatedHand hand = evaluateFive(fiveCards);
            if (!bestHand || hand > *bestHand) {
                bestHand = std::move(hand);
            }
            return;
        }

        for (size_t i = start; i <= n - (5 - chosen); ++i) {
            fiveCards.push_back(cards[i]);
            generateCombinations(i + 1, chosen + 1);
            fiveCards.pop_back();
        }
    };

    generateCombinations(0, 0);
    return *bestHand;
}

Hand::EvaluatedHand Hand::evaluate(const std::vector<Card>& holeCards,
                                   const std::vector<Card>& communityCards) {
    std::vector<Card> allCards = holeCards;
    allCards.insert(allCards.end(), communityCards.begin(), communityCards.end());
    return evaluate(allCards);
}
