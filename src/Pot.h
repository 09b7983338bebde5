#ifndef POT_H
#define POT_H

#include "Hand.h"
#include <map>
#include <vector>

/**
 * Chip ledger for one hand. Records every contribution per seat, per
 * street and in total, and partitions the total into a main pot and side
 * pots at showdown.
 *
 * Tiers are cut at each distinct total contribution of the players still
 * contesting the pot. Folded chips stay in the tiers they reach and are
 * never returned.
 */
class Pot {
public:
    /**
     * Who receives the chips left over when a tier does not split evenly.
     * Seat order always starts at the first seat left of the dealer.
     */
    enum class OddChipPolicy {
        FIRST_LEFT_OF_DEALER,   // The whole remainder to the first winner
        SPREAD_LEFT_OF_DEALER   // One chip each to winners in seat order
    };

    struct Tier {
        int amount;
        int threshold;                 // Contribution needed to be eligible
        std::vector<int> eligibleSeats;

        Tier() : amount(0), threshold(0) {}
    };

    struct TierAward {
        Tier tier;
        std::vector<int> winnerSeats;  // Seat order left of the dealer
        std::map<int, int> awards;     // seat -> chips
    };

private:
    std::vector<int> contributions;        // Whole hand, per seat
    std::vector<int> streetContributions;  // Current street, per seat

    void checkSeat(int seat) const;

public:
    explicit Pot(int seatCount = 0);

    /**
     * Clears the ledger for a new hand
     */
    void reset(int seatCount);

    /**
     * Records `amount` chips moved from `seat` into the pot
     */
    void contribute(int seat, int amount);

    /**
     * Starts a new street; per-street totals go back to zero
     */
    void startNewStreet();

    int getTotalPot() const noexcept;

    int getContribution(int seat) const;

    int getStreetContribution(int seat) const;

    int getStreetTotal() const noexcept;

    int getSeatCount() const noexcept { return static_cast<int>(contributions.size()); }

    /**
     * Current tier layout given the seats still contesting the pot.
     * The first tier is the main pot, the rest are side pots.
     */
    [[nodiscard]] std::vector<Tier> computeTiers(const std::vector<int>& liveSeats) const;

    /**
     * Splits every tier among its best eligible hands. Throws
     * PotConservationError if the awards would not add up to the pot.
     */
    [[nodiscard]] std::vector<TierAward> resolve(const std::vector<int>& liveSeats,
                                                 const std::map<int, Hand::EvaluatedHand>& rankBySeat,
                                                 int dealerSeat,
                                                 OddChipPolicy policy) const;

    /**
     * Everyone else folded: the whole pot goes to `seat`, nothing is evaluated
     */
    [[nodiscard]] std::vector<TierAward> awardUncontested(int seat) const;
};

#endif // POT_H
