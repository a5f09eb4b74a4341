#pragma once

/// @file include/shuffled/reconciler.hpp
/// @brief Reconciler: turns raw detector candidates into the reported set.
///
/// # Module: Reconciler
///
/// ## Passes (in order)
/// 1. Aggregate subsumption: "N Pairs" drops every Pair, "Two Triples" every
///    Triple, "Two Quads" every Quad.
/// 2. Cross-family suppression: for each rule in table order, a loser is
///    removed if its positions intersect any surviving winner instance.
/// 3. Per-identifier dedup: one find per id, the one with the most
///    positions; the first encountered wins ties. Survivors keep the order in
///    which their id first appeared.
///
/// ## Guarantees
/// - Pure and idempotent: reconcile(reconcile(x)) == reconcile(x)
/// - Never reorders finds except as described in pass 3

#include "shuffled/types.hpp"

#include <span>
#include <string_view>
#include <vector>

namespace shuffled::reconcile {

/// A winner id suppresses overlapping instances of each loser id.
struct SuppressionRule {
    std::string_view                  winner;
    std::span<const std::string_view> losers;
};

/// Static passes over candidate lists. Holds no state.
class Reconciler {
public:
    Reconciler() = delete;

    /// Run all three passes.
    [[nodiscard]] static std::vector<Find> reconcile(std::vector<Find> candidates);

    /// Pass 1.
    [[nodiscard]] static std::vector<Find> drop_aggregated(std::vector<Find> finds);

    /// Pass 2.
    [[nodiscard]] static std::vector<Find> apply_suppression(std::vector<Find> finds);

    /// Pass 3.
    [[nodiscard]] static std::vector<Find> dedupe_by_id(std::vector<Find> finds);

    /// Stable sort, rarest tier first.
    static void sort_by_rarity(std::vector<Find>& finds);

    /// True if the two position sets share at least one index.
    [[nodiscard]] static bool positions_overlap(const Positions& a,
                                                const Positions& b) noexcept;

    /// The suppression table, in application order.
    [[nodiscard]] static std::span<const SuppressionRule> rules() noexcept;
};

} // namespace shuffled::reconcile
