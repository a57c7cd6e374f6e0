#pragma once

#include <array>
#include <cstdint>
#include <limits>

// Pure pricing, split and selection arithmetic. No chain intrinsics are used
// here so the same code is linked into the contract and the native tests.
namespace rafflefi { namespace math {

    static constexpr uint8_t   BUNDLE_COUNT      = 3;
    static constexpr uint8_t   SMALL             = 0;
    static constexpr uint8_t   MEDIUM            = 1;
    static constexpr uint8_t   LARGE             = 2;

    static constexpr std::array<uint64_t, BUNDLE_COUNT> BUNDLE_AMOUNTS              = { 45, 200, 660 };
    static constexpr std::array<int64_t,  BUNDLE_COUNT> BUNDLE_PRICE_MULTIPLIERS    = { 1, 3, 5 };

    static constexpr uint64_t  PCT_BOOST         = 100;
    static constexpr uint64_t  DONATION_PCT      = 75;     //share of the non-prize remainder

    struct bundle_terms {
        uint64_t    amount  = 0;        //tickets granted
        int64_t     price   = 0;        //in the smallest currency unit
    };
    using bundle_terms_list = std::array<bundle_terms, BUNDLE_COUNT>;

    struct pot_split {
        int64_t     prize       = 0;
        int64_t     donation    = 0;
        int64_t     commission  = 0;
    };

    /**
     * Derives the small/medium/large bundles from the base ticket price.
     * Returns false when the price is not positive or a tier price overflows.
     */
    inline bool make_bundles(int64_t ticket_price, bundle_terms_list& bundles) {
        if (ticket_price <= 0) return false;

        for (uint8_t i = 0; i < BUNDLE_COUNT; i++) {
            auto multiplier = BUNDLE_PRICE_MULTIPLIERS[i];
            if (ticket_price > std::numeric_limits<int64_t>::max() / multiplier)
                return false;
            bundles[i].amount   = BUNDLE_AMOUNTS[i];
            bundles[i].price    = ticket_price * multiplier;
        }
        return true;
    }

    //largest tier whose price is covered by `paid`, BUNDLE_COUNT if none is
    inline uint8_t classify_payment(const bundle_terms_list& bundles, int64_t paid) {
        for (uint8_t i = BUNDLE_COUNT; i > 0; i--) {
            const auto& bundle = bundles[i - 1];
            if (bundle.price > 0 && paid >= bundle.price)
                return i - 1;
        }
        return BUNDLE_COUNT;
    }

    //the fixed prize once the pot exceeds it, half of the pot otherwise
    inline int64_t prize_of(int64_t pot, int64_t fixed_prize) {
        if (pot <= 0) return 0;
        if (fixed_prize > 0 && pot > fixed_prize)
            return fixed_prize;
        return pot / 2;
    }

    inline pot_split split_pot(int64_t pot, int64_t fixed_prize, uint64_t donation_pct = DONATION_PCT) {
        pot_split split;
        if (pot <= 0) return split;

        split.prize         = prize_of(pot, fixed_prize);
        auto remainder      = pot - split.prize;
        split.donation      = (int64_t)((__int128)remainder * donation_pct / PCT_BOOST);
        split.commission    = pot - split.prize - split.donation;   //rounding dust stays with the commission
        return split;
    }

    /**
     * Weighted linear scan: walks [first, last) accumulating `weight_of(item)`
     * and returns the first item whose running sum strictly exceeds `roll`.
     * Every item owns a contiguous block of weight_of(item) slots, so with
     * roll uniform in [0, total) an item wins with probability weight/total.
     * Returns `last` when roll >= total.
     */
    template<typename Iterator, typename WeightOf>
    Iterator pick_weighted(Iterator first, Iterator last, uint64_t roll, WeightOf weight_of) {
        uint64_t cumulative = 0;
        for (; first != last; ++first) {
            cumulative += weight_of(*first);
            if (cumulative > roll)
                return first;
        }
        return last;
    }

    //first 8 bytes of a digest, big endian
    inline uint64_t digest_to_uint64(const std::array<uint8_t, 32>& digest) {
        uint64_t value = 0;
        for (uint8_t i = 0; i < 8; i++)
            value = (value << 8) | digest[i];
        return value;
    }

    inline uint64_t roll_of(uint64_t random, uint64_t total) {
        return total == 0 ? 0 : random % total;
    }

} } //namespace rafflefi::math
