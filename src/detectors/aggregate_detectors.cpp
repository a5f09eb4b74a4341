/**
 * @file  aggregate_detectors.cpp
 * @brief Whole-deck detectors: counting aggregates, mirror symmetry and the
 *        two top-of-deck checks (Ace High, Ascending Top Five).
 */

#include "shuffled/detectors.hpp"

#include "shuffled/constants.hpp"
#include "run_scan.hpp"

#include <fmt/format.h>

#include <utility>

namespace shuffled::detectors {

using namespace shuffled::constants;
using detail::make_find;
using detail::range_positions;

namespace {

constexpr std::string_view COUNT_ICON     = "🃏";
constexpr std::string_view MIRROR_ICON    = "🪞";
constexpr std::string_view ACE_HIGH_ICON  = "🂡";
constexpr std::string_view ASCENDING_ICON = "⬆️";

/// Members of one same-rank id, and the union of their positions.
struct Members {
    std::size_t count = 0;
    Positions   positions;
};

Members collect(std::span<const Find> finds, std::string_view id) {
    Members m;
    for (const auto& f : finds) {
        if (f.id != id) continue;
        ++m.count;
        m.positions.insert(m.positions.end(), f.positions.begin(), f.positions.end());
    }
    return m;
}

} // anonymous namespace

// ─── Counting Finds ───────────────────────────────────────────────────────────

Candidates counting_finds(std::span<const Find> same_rank) {
    Candidates finds;

    // Triples and quads do not count as pairs here.
    auto pairs   = collect(same_rank, find_ids::PAIR);
    auto triples = collect(same_rank, find_ids::TRIPLE);
    auto quads   = collect(same_rank, find_ids::QUAD);

    if (pairs.count >= MIN_PAIRS_FOR_COUNT) {
        finds.push_back(make_find(find_ids::THREE_PAIRS,
                                  fmt::format("{} Pairs", pairs.count),
                                  COUNT_ICON, RarityTier::Uncommon,
                                  std::move(pairs.positions)));
    }
    if (triples.count >= MIN_TRIPLES_FOR_COUNT) {
        finds.push_back(make_find(find_ids::TWO_TRIPLES, "Two Triples",
                                  COUNT_ICON, RarityTier::Rare,
                                  std::move(triples.positions)));
    }
    if (quads.count >= MIN_QUADS_FOR_COUNT) {
        finds.push_back(make_find(find_ids::TWO_QUADS, "Two Quads",
                                  COUNT_ICON, RarityTier::Extraordinary,
                                  std::move(quads.positions)));
    }
    return finds;
}

// ─── Mirror ───────────────────────────────────────────────────────────────────

Candidates mirror_symmetry(std::span<const Card> deck) {
    const std::size_t n = deck.size();
    Positions positions;
    for (std::size_t i = 0; i < n / 2; ++i) {
        const std::size_t opposite = n - 1 - i;
        if (deck[i].rank == deck[opposite].rank) {
            positions.push_back(i);
            positions.push_back(opposite);
        }
    }

    const std::size_t mirrors = positions.size() / 2;
    if (mirrors < MIN_MIRRORS) {
        return {};
    }
    Candidates finds;
    finds.push_back(make_find(find_ids::MIRROR, fmt::format("{} Mirrors", mirrors),
                              MIRROR_ICON, RarityTier::Uncommon, std::move(positions)));
    return finds;
}

// ─── Top of Deck ──────────────────────────────────────────────────────────────

Candidates ace_high(std::span<const Card> deck) {
    if (deck.empty() || deck[0].rank != Rank::Ace || deck[0].suit != Suit::Spades) {
        return {};
    }
    Candidates finds;
    finds.push_back(make_find(find_ids::ACE_HIGH, "Ace High", ACE_HIGH_ICON,
                              RarityTier::Rare, Positions{0}));
    return finds;
}

Candidates ascending_top_five(std::span<const Card> deck) {
    if (deck.size() < 5) {
        return {};
    }
    for (std::size_t i = 1; i < 5; ++i) {
        if (deck[i].value <= deck[i - 1].value) {
            return {};
        }
    }
    Candidates finds;
    finds.push_back(make_find(find_ids::ASCENDING_TOP_5, "Ascending Top Five",
                              ASCENDING_ICON, RarityTier::Extraordinary,
                              range_positions(0, 5)));
    return finds;
}

} // namespace shuffled::detectors
