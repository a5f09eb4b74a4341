#pragma once

/// @file include/shuffled/detectors.hpp
/// @brief Detector Catalogue: one pure scan per pattern family.
///
/// # Module: Detectors
///
/// ## Responsibility
/// Scan a parsed deck and emit candidate finds. Each detector reports
/// maximal instances only: the longest run, the fullest group. A shorter
/// instance strictly inside a longer one of the same family is never
/// reported, and each instance yields only the best tier it qualifies for.
///
/// ## Input Contract
/// Detectors are total over any sequence length, including the empty one.
/// On a validated 52-card deck they implement the catalogue exactly; on
/// shorter inputs (unit tests) windows and mirrors shrink to fit.
///
/// ## Guarantees
/// - Stateless: no detector reads another's output except `counting_finds`,
///   which takes the same-rank result explicitly
/// - Candidates come out in ascending position order
/// - Cross-detector overlap is left to the Reconciler

#include "shuffled/types.hpp"

#include <span>
#include <string>
#include <vector>

namespace shuffled::detectors {

using Candidates = std::vector<Find>;

/// Adjacent equal ranks: 2 → Pair (Common), 3 → Triple (Uncommon),
/// 4+ → Quad (Very Rare).
[[nodiscard]] Candidates same_rank_groups(std::span<const Card> deck);

/// Adjacent equal suits, length ≥ 3: 3 Common, 4 Uncommon, 5–6 Rare,
/// 7 Very Rare, 8+ Extraordinary.
[[nodiscard]] Candidates suited_streaks(std::span<const Card> deck);

/// Ascending consecutive values, length ≥ 3, with a single King→Ace
/// extension per run: 3 Common, 4 Uncommon, 5 Straight (Rare), 6+ Very Rare.
[[nodiscard]] Candidates rank_runs(std::span<const Card> deck);

/// Adjacent equal colours, length ≥ 6: 6–7 Uncommon, 8–9 Rare, 10+ Very Rare.
[[nodiscard]] Candidates color_streaks(std::span<const Card> deck);

/// Strictly alternating colours, length ≥ 7: 7–9 Rare, 10+ Very Rare.
[[nodiscard]] Candidates alternating_colors(std::span<const Card> deck);

/// Every adjacent Ace + ten-value pair: A♠/J♠ Perfect (Rare), same suit
/// Suited (Uncommon), otherwise Blackjack (Common).
[[nodiscard]] Candidates blackjack_pairs(std::span<const Card> deck);

/// Aggregates over the same-rank result: 3+ pairs, 2+ triples, 2+ quads.
[[nodiscard]] Candidates counting_finds(std::span<const Find> same_rank);

/// Equal ranks at positions i and n−1−i; 3+ mirrors → Mirror (Uncommon).
[[nodiscard]] Candidates mirror_symmetry(std::span<const Card> deck);

/// Every 4-window with ranks AABB, A ≠ B → Two Pair (Rare).
[[nodiscard]] Candidates two_pair_windows(std::span<const Card> deck);

/// Every 5-window with ranks AAABB or AABBB, A ≠ B → Full House (Very Rare).
[[nodiscard]] Candidates full_house_windows(std::span<const Card> deck);

/// Suited ascending runs, length ≥ 5, with a same-suit King→Ace extension.
/// Values exactly {1,10,11,12,13} → Royal Flush (Legendary), otherwise
/// Straight Flush (Extraordinary).
[[nodiscard]] Candidates straight_flushes(std::span<const Card> deck);

/// Every 4-window holding exactly two Aces and two 8s (Extraordinary).
[[nodiscard]] Candidates dead_mans_hand(std::span<const Card> deck);

/// Runs descending by one with alternating colours, length ≥ 5
/// (Extraordinary).
[[nodiscard]] Candidates solitaire_runs(std::span<const Card> deck);

/// A♠ on top of the deck (Rare).
[[nodiscard]] Candidates ace_high(std::span<const Card> deck);

/// First five values strictly increasing (Extraordinary).
[[nodiscard]] Candidates ascending_top_five(std::span<const Card> deck);

/// Raw-token runs matching FACTORY_ORDER position for position, length ≥ 4
/// (Extraordinary). One find per disjoint run.
[[nodiscard]] Candidates factory_runs(std::span<const std::string> tokens);

} // namespace shuffled::detectors
