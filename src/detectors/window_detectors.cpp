/**
 * @file  window_detectors.cpp
 * @brief Fixed-width sliding-window detectors: Blackjack (2), Two Pair (4),
 *        Dead Man's Hand (4) and Full House (5).
 *
 * Windows are evaluated independently; overlapping hits are all emitted and
 * left to the Reconciler.
 */

#include "shuffled/detectors.hpp"

#include "shuffled/constants.hpp"
#include "run_scan.hpp"

#include <algorithm>

namespace shuffled::detectors {

using detail::make_find;
using detail::range_positions;

namespace {

constexpr std::string_view BLACKJACK_ICON  = "🂡";
constexpr std::string_view TWO_PAIR_ICON   = "🃏";
constexpr std::string_view FULL_HOUSE_ICON = "🏠";
constexpr std::string_view DEAD_MAN_ICON   = "💀";

bool is_ten_value(const Card& card) noexcept {
    return card.value >= constants::TEN_VALUE;
}

bool is_card(const Card& card, Rank rank, Suit suit) noexcept {
    return card.rank == rank && card.suit == suit;
}

/// Call fn(i) for every window start i with room for `width` cards.
template <typename Fn>
void for_each_window(std::size_t n, std::size_t width, Fn&& fn) {
    if (n < width) return;
    for (std::size_t i = 0; i + width <= n; ++i) {
        fn(i);
    }
}

} // anonymous namespace

// ─── Blackjack ────────────────────────────────────────────────────────────────

Candidates blackjack_pairs(std::span<const Card> deck) {
    Candidates finds;
    for_each_window(deck.size(), 2, [&](std::size_t i) {
        const Card& a = deck[i];
        const Card& b = deck[i + 1];

        const Card* ace = nullptr;
        const Card* ten = nullptr;
        if (a.rank == Rank::Ace && is_ten_value(b)) {
            ace = &a; ten = &b;
        } else if (b.rank == Rank::Ace && is_ten_value(a)) {
            ace = &b; ten = &a;
        } else {
            return;
        }

        if (is_card(*ace, Rank::Ace, Suit::Spades) && is_card(*ten, Rank::Jack, Suit::Spades)) {
            finds.push_back(make_find(find_ids::PERFECT_BLACKJACK, "Perfect Blackjack",
                                      BLACKJACK_ICON, RarityTier::Rare,
                                      range_positions(i, i + 2)));
        } else if (ace->suit == ten->suit) {
            finds.push_back(make_find(find_ids::SUITED_BLACKJACK, "Suited Blackjack",
                                      BLACKJACK_ICON, RarityTier::Uncommon,
                                      range_positions(i, i + 2)));
        } else {
            finds.push_back(make_find(find_ids::BLACKJACK, "Blackjack",
                                      BLACKJACK_ICON, RarityTier::Common,
                                      range_positions(i, i + 2)));
        }
    });
    return finds;
}

// ─── Two Pair ─────────────────────────────────────────────────────────────────

Candidates two_pair_windows(std::span<const Card> deck) {
    Candidates finds;
    for_each_window(deck.size(), 4, [&](std::size_t i) {
        const Rank r0 = deck[i].rank;
        const Rank r2 = deck[i + 2].rank;
        if (r0 == deck[i + 1].rank && r2 == deck[i + 3].rank && r0 != r2) {
            finds.push_back(make_find(find_ids::TWO_PAIR, "Two Pair", TWO_PAIR_ICON,
                                      RarityTier::Rare, range_positions(i, i + 4)));
        }
    });
    return finds;
}

// ─── Full House ───────────────────────────────────────────────────────────────

Candidates full_house_windows(std::span<const Card> deck) {
    Candidates finds;
    for_each_window(deck.size(), 5, [&](std::size_t i) {
        const auto r = [&](std::size_t k) { return deck[i + k].rank; };

        const bool three_two = r(0) == r(1) && r(1) == r(2)
                            && r(3) == r(4) && r(0) != r(3);
        const bool two_three = r(0) == r(1)
                            && r(2) == r(3) && r(3) == r(4) && r(0) != r(2);

        if (three_two || two_three) {
            finds.push_back(make_find(find_ids::FULL_HOUSE, "Full House", FULL_HOUSE_ICON,
                                      RarityTier::VeryRare, range_positions(i, i + 5)));
        }
    });
    return finds;
}

// ─── Dead Man's Hand ──────────────────────────────────────────────────────────

Candidates dead_mans_hand(std::span<const Card> deck) {
    Candidates finds;
    for_each_window(deck.size(), 4, [&](std::size_t i) {
        const auto window = deck.subspan(i, 4);
        const auto aces = std::count_if(window.begin(), window.end(),
                                        [](const Card& c) { return c.rank == Rank::Ace; });
        const auto eights = std::count_if(window.begin(), window.end(),
                                          [](const Card& c) { return c.rank == Rank::Eight; });
        if (aces == 2 && eights == 2) {
            finds.push_back(make_find(find_ids::DEAD_MANS_HAND, "Dead Man's Hand",
                                      DEAD_MAN_ICON, RarityTier::Extraordinary,
                                      range_positions(i, i + 4)));
        }
    });
    return finds;
}

} // namespace shuffled::detectors
