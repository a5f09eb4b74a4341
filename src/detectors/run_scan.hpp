#pragma once
/**
 * @file  run_scan.hpp
 * @brief Shared scanning primitives for the detector catalogue.
 *
 * Module:  src/detectors/
 *
 * Two maximal-run walkers cover every streak-shaped detector:
 *
 *   for_each_maximal_run       partitions [0, n) into maximal runs of a
 *                              pairwise predicate (card i continues card i−1).
 *   for_each_ace_extended_run  the same, but a run whose last card is a King
 *                              may claim one immediately following Ace
 *                              (acting as 14). The Ace is consumed: the next
 *                              run starts after it.
 *
 * Both walkers visit runs of every length, including 1; callers apply their
 * own minimum.
 */

#include "shuffled/constants.hpp"
#include "shuffled/types.hpp"

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace shuffled::detectors::detail {

/// [begin, end) as an explicit position list.
[[nodiscard]] Positions range_positions(std::size_t begin, std::size_t end);

/// Assemble a Find.
[[nodiscard]] Find make_find(std::string_view id,
                             std::string      name,
                             std::string_view icon,
                             RarityTier       tier,
                             Positions        positions);

/// Visit each maximal run as on_run(begin, end).
template <typename Continues, typename OnRun>
void for_each_maximal_run(std::size_t n, Continues&& continues, OnRun&& on_run) {
    std::size_t start = 0;
    while (start < n) {
        std::size_t end = start + 1;
        while (end < n && continues(start, end)) {
            ++end;
        }
        on_run(start, end);
        start = end;
    }
}

/// Visit each maximal run, letting a run that ends on a King absorb the Ace
/// right after it when ace_joins(start, ace_index) agrees.
template <typename Continues, typename AceJoins, typename OnRun>
void for_each_ace_extended_run(std::span<const Card> deck,
                               Continues&&           continues,
                               AceJoins&&            ace_joins,
                               OnRun&&               on_run) {
    const std::size_t n = deck.size();
    std::size_t start = 0;
    while (start < n) {
        std::size_t end = start + 1;
        while (end < n && continues(start, end)) {
            ++end;
        }
        if (end < n
            && deck[end - 1].value == constants::KING_VALUE
            && deck[end].rank == Rank::Ace
            && ace_joins(start, end)) {
            ++end;
        }
        on_run(start, end);
        start = end;
    }
}

} // namespace shuffled::detectors::detail
