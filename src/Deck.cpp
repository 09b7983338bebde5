#include "Deck.h"
#include "PokerErrors.h"
#include <algorithm>
#include <array>
#include <stdexcept>

Deck::Deck() : currentCard(0), rng(std::random_device{}()) {
    reset();
}

Deck::Deck(unsigned int seed) : currentCard(0), rng(seed) {
    reset();
}

void Deck::populate() {
    cards.clear();
    cards.reserve(Card::kDeckSize);
    currentCard = 0;

    for (int s = 0; s < Card::kSuitCount; s++) {
        const Card::Suit suit = static_cast<Card::Suit>(s);
        for (int r = Card::kMinRank; r <= Card::kMaxRank; r++) {
            cards.emplace_back(static_cast<Card::Rank>(r), suit);
        }
    }
}

void Deck::reset() {
    populate();
    std::shuffle(cards.begin(), cards.end(), rng);
}

void Deck::reseed(unsigned int seed) {
    rng.seed(seed);
}

void Deck::stack(const std::vector<Card>& top) {
    if (top.size() > static_cast<size_t>(Card::kDeckSize)) {
        throw std::invalid_argument("Cannot stack more than 52 cards");
    }

    std::array<bool, Card::kDeckSize> used{};
    for (const auto& card : top) {
        if (used[card.index()]) {
            throw std::invalid_argument("Duplicate stacked card: " + card.toString());
        }
        used[card.index()] = true;
    }

    std::vector<Card> ordered(top.begin(), top.end());
    ordered.reserve(Card::kDeckSize);
    for (const auto& card : cards) {
        if (!used[card.index()]) {
            ordered.push_back(card);
        }
    }

    cards = std::move(ordered);
    currentCard = 0;
}

Card Deck::dealCard() {
    if (currentCard >= cards.size()) {
        throw EmptyDeckError();
    }
    return cards[currentCard++];
}

std::vector<Card> Deck::dealCards(size_t count) {
    std::vector<Card> dealt;
    dealt.reserve(count);

    for (size_t i = 0; i < count; i++) {
        dealt.push_back(dealCard());
    }

    return dealt;
}

std::vector<Card> Deck::remaining() const {
    return std::vector<Card>(cards.begin() + static_cast<std::ptrdiff_t>(currentCard), cards.end());
}
