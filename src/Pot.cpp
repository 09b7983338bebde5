#include "Pot.h"
#include "PokerErrors.h"
#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <string>

Pot::Pot(int seatCount) {
    reset(seatCount);
}

void Pot::reset(int seatCount) {
    if (seatCount < 0) {
        throw std::invalid_argument("Seat count must not be negative");
    }
    contributions.assign(static_cast<size_t>(seatCount), 0);
    streetContributions.assign(static_cast<size_t>(seatCount), 0);
}

void Pot::checkSeat(int seat) const {
    if (seat < 0 || seat >= getSeatCount()) {
        throw std::out_of_range("No such seat in pot ledger: " + std::to_string(seat));
    }
}

void Pot::contribute(int seat, int amount) {
    checkSeat(seat);
    if (amount < 0) {
        throw std::invalid_argument("Contribution must not be negative");
    }
    contributions[seat] += amount;
    streetContributions[seat] += amount;
}

void Pot::startNewStreet() {
    std::fill(streetContributions.begin(), streetContributions.end(), 0);
}

int Pot::getTotalPot() const noexcept {
    return std::accumulate(contributions.begin(), contributions.end(), 0);
}

int Pot::getContribution(int seat) const {
    checkSeat(seat);
    return contributions[seat];
}

int Pot::getStreetContribution(int seat) const {
    checkSeat(seat);
    return streetContributions[seat];
}

int Pot::getStreetTotal() const noexcept {
    return std::accumulate(streetContributions.begin(), streetContributions.end(), 0);
}

std::vector<Pot::Tier> Pot::computeTiers(const std::vector<int>& liveSeats) const {
    std::vector<int> levels;
    levels.reserve(liveSeats.size());
    for (int seat : liveSeats) {
        checkSeat(seat);
        if (contributions[seat] > 0) {
            levels.push_back(contributions[seat]);
        }
    }
    std::sort(levels.begin(), levels.end());
    levels.erase(std::unique(levels.begin(), levels.end()), levels.end());

    std::vector<Tier> tiers;
    const int total = getTotalPot();
    if (levels.empty()) {
        if (total > 0) {
            // Nobody left to contest the chips; surfaces as a conservation failure
            Tier orphan;
            orphan.amount = total;
            tiers.push_back(orphan);
        }
        return tiers;
    }

    const int highest = *std::max_element(contributions.begin(), contributions.end());
    int previousLevel = 0;

    for (size_t i = 0; i < levels.size(); i++) {
        // Chips above the deepest live stack belong to the top tier
        const int cap = (i + 1 == levels.size()) ? highest : levels[i];

        Tier tier;
        tier.threshold = levels[i];
        for (int c : contributions) {
            tier.amount += std::min(c, cap) - std::min(c, previousLevel);
        }
        for (int seat : liveSeats) {
            if (contributions[seat] >= levels[i]) {
                tier.eligibleSeats.push_back(seat);
            }
        }
        std::sort(tier.eligibleSeats.begin(), tier.eligibleSeats.end());

        tiers.push_back(std::move(tier));
        previousLevel = levels[i];
    }

    return tiers;
}

std::vector<Pot::TierAward> Pot::resolve(const std::vector<int>& liveSeats,
                                         const std::map<int, Hand::EvaluatedHand>& rankBySeat,
                                         int dealerSeat,
                                         OddChipPolicy policy) const {
    const int seatCount = getSeatCount();
    auto distanceFromDealer = [&](int seat) {
        return (seat - dealerSeat - 1 + 2 * seatCount) % seatCount;
    };

    std::vector<TierAward> results;
    long long awarded = 0;

    for (auto& tier : computeTiers(liveSeats)) {
        TierAward result;
        result.tier = tier;

        const Hand::EvaluatedHand* best = nullptr;
        for (int seat : tier.eligibleSeats) {
            auto it = rankBySeat.find(seat);
            if (it == rankBySeat.end()) {
                throw std::invalid_argument("No hand rank for eligible seat " + std::to_string(seat));
            }
            if (!best || it->second > *best) {
                best = &it->second;
            }
        }

        for (int seat : tier.eligibleSeats) {
            if (rankBySeat.at(seat) == *best) {
                result.winnerSeats.push_back(seat);
            }
        }
        std::sort(result.winnerSeats.begin(), result.winnerSeats.end(), [&](int a, int b) {
            return distanceFromDealer(a) < distanceFromDealer(b);
        });

        if (!result.winnerSeats.empty()) {
            const int winners = static_cast<int>(result.winnerSeats.size());
            const int share = tier.amount / winners;
            int remainder = tier.amount % winners;

            for (int seat : result.winnerSeats) {
                int chips = share;
                if (policy == OddChipPolicy::FIRST_LEFT_OF_DEALER) {
                    chips += remainder;
                    remainder = 0;
                } else if (remainder > 0) {
                    chips += 1;
                    remainder--;
                }
                result.awards[seat] += chips;
                awarded += chips;
            }
        }

        results.push_back(std::move(result));
    }

    const long long contributed = getTotalPot();
    if (awarded != contributed) {
        throw PotConservationError(contributed, awarded);
    }

    return results;
}

std::vector<Pot::TierAward> Pot::awardUncontested(int seat) const {
    checkSeat(seat);

    TierAward result;
    result.tier.amount = getTotalPot();
    result.tier.threshold = contributions[seat];
    result.tier.eligibleSeats = {seat};
    result.winnerSeats = {seat};
    result.awards[seat] = result.tier.amount;

    return {result};
}
