/**
 * @file  sequence_detectors.cpp
 * @brief Streak-shaped detectors: same rank, suit, rank runs, colour,
 *        alternating colour, straight flush, solitaire and factory runs.
 *
 * Every detector here walks the deck once with one of the run_scan.hpp
 * walkers and maps the length of each maximal run to a single tier.
 */

#include "shuffled/detectors.hpp"

#include "shuffled/card.hpp"
#include "shuffled/constants.hpp"
#include "shuffled/factory.hpp"
#include "run_scan.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <utility>

namespace shuffled::detectors {

using namespace shuffled::constants;
using detail::for_each_ace_extended_run;
using detail::for_each_maximal_run;
using detail::make_find;
using detail::range_positions;

namespace {

constexpr std::string_view RANK_ICON      = "🃏";
constexpr std::string_view RUN_ICON       = "📈";
constexpr std::string_view RED_ICON       = "🔴";
constexpr std::string_view BLACK_ICON     = "⚫";
constexpr std::string_view ALTERNATE_ICON = "🎭";
constexpr std::string_view ROYAL_ICON     = "👑";
constexpr std::string_view FLUSH_ICON     = "⚡";
constexpr std::string_view SOLITAIRE_ICON = "🂠";
constexpr std::string_view FACTORY_ICON   = "🏭";

std::string_view color_label(Color color) noexcept {
    return color == Color::Red ? "Red" : "Black";
}

} // anonymous namespace

// ─── Same-Rank Groups ─────────────────────────────────────────────────────────

Candidates same_rank_groups(std::span<const Card> deck) {
    Candidates finds;
    for_each_maximal_run(
        deck.size(),
        [&](std::size_t start, std::size_t i) { return deck[i].rank == deck[start].rank; },
        [&](std::size_t begin, std::size_t end) {
            const std::size_t len = end - begin;
            const Rank rank = deck[begin].rank;
            if (len >= 4) {
                finds.push_back(make_find(find_ids::QUAD,
                                          fmt::format("Quad {}", rank_plural(rank)),
                                          RANK_ICON, RarityTier::VeryRare,
                                          range_positions(begin, end)));
            } else if (len == 3) {
                finds.push_back(make_find(find_ids::TRIPLE,
                                          fmt::format("Triple {}", rank_plural(rank)),
                                          RANK_ICON, RarityTier::Uncommon,
                                          range_positions(begin, end)));
            } else if (len == 2) {
                finds.push_back(make_find(find_ids::PAIR,
                                          fmt::format("Pair of {}", rank_plural(rank)),
                                          RANK_ICON, RarityTier::Common,
                                          range_positions(begin, end)));
            }
        });
    return finds;
}

// ─── Suited Streaks ───────────────────────────────────────────────────────────

Candidates suited_streaks(std::span<const Card> deck) {
    Candidates finds;
    for_each_maximal_run(
        deck.size(),
        [&](std::size_t start, std::size_t i) { return deck[i].suit == deck[start].suit; },
        [&](std::size_t begin, std::size_t end) {
            const std::size_t len = end - begin;
            if (len < MIN_SUITED_STREAK) return;

            const Suit suit = deck[begin].suit;
            const std::string_view suit_label = suit_name(suit);

            std::string_view id;
            std::string      name;
            RarityTier       tier;
            if (len >= 8) {
                id = find_ids::SUITED_8;  name = fmt::format("8+ {}", suit_label);
                tier = RarityTier::Extraordinary;
            } else if (len == 7) {
                id = find_ids::SUITED_7;  name = fmt::format("7 {}", suit_label);
                tier = RarityTier::VeryRare;
            } else if (len == 6) {
                id = find_ids::SUITED_6;  name = fmt::format("6 {}", suit_label);
                tier = RarityTier::Rare;
            } else if (len == 5) {
                id = find_ids::SUITED_5;  name = fmt::format("5 {}", suit_label);
                tier = RarityTier::Rare;
            } else if (len == 4) {
                id = find_ids::SUITED_4;  name = fmt::format("4 {}", suit_label);
                tier = RarityTier::Uncommon;
            } else {
                id = find_ids::SUITED_3;  name = fmt::format("3 {}", suit_label);
                tier = RarityTier::Common;
            }
            finds.push_back(make_find(id, std::move(name), suit_symbol(suit), tier,
                                      range_positions(begin, end)));
        });
    return finds;
}

// ─── Rank Runs ────────────────────────────────────────────────────────────────

Candidates rank_runs(std::span<const Card> deck) {
    Candidates finds;
    for_each_ace_extended_run(
        deck,
        [&](std::size_t, std::size_t i) { return deck[i].value == deck[i - 1].value + 1; },
        [](std::size_t, std::size_t) { return true; },
        [&](std::size_t begin, std::size_t end) {
            const std::size_t len = end - begin;
            if (len < MIN_RANK_RUN) return;

            if (len >= 7) {
                finds.push_back(make_find(find_ids::RUN_7, fmt::format("Run of {}", len),
                                          RUN_ICON, RarityTier::VeryRare,
                                          range_positions(begin, end)));
            } else if (len == 6) {
                finds.push_back(make_find(find_ids::RUN_6, "Run of 6",
                                          RUN_ICON, RarityTier::VeryRare,
                                          range_positions(begin, end)));
            } else if (len == 5) {
                finds.push_back(make_find(find_ids::STRAIGHT, "Straight",
                                          RUN_ICON, RarityTier::Rare,
                                          range_positions(begin, end)));
            } else if (len == 4) {
                finds.push_back(make_find(find_ids::RUN_4, "Run of 4",
                                          RUN_ICON, RarityTier::Uncommon,
                                          range_positions(begin, end)));
            } else {
                finds.push_back(make_find(find_ids::RUN_3, "Run of 3",
                                          RUN_ICON, RarityTier::Common,
                                          range_positions(begin, end)));
            }
        });
    return finds;
}

// ─── Colour Streaks ───────────────────────────────────────────────────────────

Candidates color_streaks(std::span<const Card> deck) {
    Candidates finds;
    for_each_maximal_run(
        deck.size(),
        [&](std::size_t start, std::size_t i) { return deck[i].color == deck[start].color; },
        [&](std::size_t begin, std::size_t end) {
            const std::size_t len = end - begin;
            if (len < MIN_COLOR_STREAK) return;

            const Color color = deck[begin].color;
            auto name = fmt::format("{} Streak of {}", color_label(color), len);
            const std::string_view icon = color == Color::Red ? RED_ICON : BLACK_ICON;

            if (len >= 10) {
                finds.push_back(make_find(find_ids::COLOUR_10, std::move(name), icon,
                                          RarityTier::VeryRare, range_positions(begin, end)));
            } else if (len >= 8) {
                finds.push_back(make_find(find_ids::COLOUR_8, std::move(name), icon,
                                          RarityTier::Rare, range_positions(begin, end)));
            } else {
                finds.push_back(make_find(find_ids::COLOUR_6, std::move(name), icon,
                                          RarityTier::Uncommon, range_positions(begin, end)));
            }
        });
    return finds;
}

// ─── Alternating Colour ───────────────────────────────────────────────────────

Candidates alternating_colors(std::span<const Card> deck) {
    Candidates finds;
    for_each_maximal_run(
        deck.size(),
        [&](std::size_t, std::size_t i) { return deck[i].color != deck[i - 1].color; },
        [&](std::size_t begin, std::size_t end) {
            const std::size_t len = end - begin;
            if (len < MIN_ALTERNATING_RUN) return;

            auto name = fmt::format("Alternating {}", len);
            if (len >= 10) {
                finds.push_back(make_find(find_ids::ALTERNATING_10, std::move(name),
                                          ALTERNATE_ICON, RarityTier::VeryRare,
                                          range_positions(begin, end)));
            } else {
                finds.push_back(make_find(find_ids::ALTERNATING_7, std::move(name),
                                          ALTERNATE_ICON, RarityTier::Rare,
                                          range_positions(begin, end)));
            }
        });
    return finds;
}

// ─── Straight Flush / Royal Flush ─────────────────────────────────────────────

Candidates straight_flushes(std::span<const Card> deck) {
    Candidates finds;
    for_each_ace_extended_run(
        deck,
        [&](std::size_t start, std::size_t i) {
            return deck[i].suit == deck[start].suit
                && deck[i].value == deck[i - 1].value + 1;
        },
        [&](std::size_t start, std::size_t ace) { return deck[ace].suit == deck[start].suit; },
        [&](std::size_t begin, std::size_t end) {
            if (end - begin < MIN_STRAIGHT_FLUSH) return;

            // Royal iff the values are exactly {1, 10, 11, 12, 13}.
            std::array<bool, KING_VALUE + 1> present{};
            for (std::size_t k = begin; k < end; ++k) {
                present[static_cast<std::size_t>(deck[k].value)] = true;
            }
            const bool royal = end - begin == 5
                && present[1] && present[10] && present[11]
                && present[12] && present[13];

            if (royal) {
                finds.push_back(make_find(find_ids::ROYAL_FLUSH,
                                          fmt::format("Royal Flush ({})",
                                                      suit_name(deck[begin].suit)),
                                          ROYAL_ICON, RarityTier::Legendary,
                                          range_positions(begin, end)));
            } else {
                finds.push_back(make_find(find_ids::STRAIGHT_FLUSH, "Straight Flush",
                                          FLUSH_ICON, RarityTier::Extraordinary,
                                          range_positions(begin, end)));
            }
        });
    return finds;
}

// ─── Solitaire Run ────────────────────────────────────────────────────────────

Candidates solitaire_runs(std::span<const Card> deck) {
    Candidates finds;
    for_each_maximal_run(
        deck.size(),
        [&](std::size_t, std::size_t i) {
            return deck[i].value == deck[i - 1].value - 1
                && deck[i].color != deck[i - 1].color;
        },
        [&](std::size_t begin, std::size_t end) {
            const std::size_t len = end - begin;
            if (len < MIN_SOLITAIRE_RUN) return;
            finds.push_back(make_find(find_ids::SOLITAIRE, fmt::format("Solitaire {}", len),
                                      SOLITAIRE_ICON, RarityTier::Extraordinary,
                                      range_positions(begin, end)));
        });
    return finds;
}

// ─── Factory Run ──────────────────────────────────────────────────────────────

Candidates factory_runs(std::span<const std::string> tokens) {
    Candidates finds;
    const std::size_t n = std::min(tokens.size(), factory::FACTORY_ORDER.size());
    const auto in_place = [&](std::size_t i) { return tokens[i] == factory::FACTORY_ORDER[i]; };

    for_each_maximal_run(
        n,
        [&](std::size_t start, std::size_t i) { return in_place(start) == in_place(i); },
        [&](std::size_t begin, std::size_t end) {
            const std::size_t len = end - begin;
            if (!in_place(begin) || len < MIN_FACTORY_RUN) return;
            finds.push_back(make_find(find_ids::FACTORY_RUN,
                                      fmt::format("Factory Run of {}", len),
                                      FACTORY_ICON, RarityTier::Extraordinary,
                                      range_positions(begin, end)));
        });
    return finds;
}

} // namespace shuffled::detectors
