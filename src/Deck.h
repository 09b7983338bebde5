#ifndef DECK_H
#define DECK_H

#include "Card.h"
#include <vector>
#include <random>

/**
 * Standard 52-card deck. Deals from the top without repetition; the deal
 * order is fully determined by the seed (or by a stacked order).
 */
class Deck {
private:
    std::vector<Card> cards;
    size_t currentCard;
    std::mt19937 rng;

public:
    Deck();

    /**
     * Constructor with seed for deterministic shuffles
     */
    explicit Deck(unsigned int seed);

    /**
     * Restores all 52 cards and shuffles them (uniform permutation)
     */
    void reset();

    /**
     * Reseeds the shuffle engine; takes effect on the next reset()
     */
    void reseed(unsigned int seed);

    /**
     * Puts the given cards on top in the given order. The remaining cards
     * keep their current relative order underneath. Throws
     * std::invalid_argument on duplicates or more than 52 cards.
     */
    void stack(const std::vector<Card>& top);

    /**
     * Deals a single card from the top of the deck.
     * Throws EmptyDeckError when no cards remain.
     */
    [[nodiscard]] Card dealCard();

    /**
     * Deals multiple cards
     */
    [[nodiscard]] std::vector<Card> dealCards(size_t count);

    size_t cardsRemaining() const noexcept {
        return cards.size() - currentCard;
    }

    size_t size() const noexcept {
        return cards.size();
    }

    /**
     * Cards not yet dealt, top first
     */
    [[nodiscard]] std::vector<Card> remaining() const;

private:
    void populate();
};

#endif // DECK_H
