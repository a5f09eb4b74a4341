/// @file src/reconcile/reconciler.cpp
/// @brief Reconciler: aggregate subsumption, cross-family suppression and
///        per-identifier dedup.

#include "shuffled/reconciler.hpp"

#include "shuffled/constants.hpp"
#include "shuffled/rarity.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace shuffled::reconcile {

namespace {

constexpr std::array<std::string_view, 10> ROYAL_LOSERS = {
    find_ids::STRAIGHT_FLUSH, find_ids::STRAIGHT, find_ids::RUN_6, find_ids::RUN_7,
    find_ids::SUITED_3, find_ids::SUITED_4, find_ids::SUITED_5,
    find_ids::SUITED_6, find_ids::SUITED_7, find_ids::SUITED_8,
};

constexpr std::array<std::string_view, 9> STRAIGHT_FLUSH_LOSERS = {
    find_ids::STRAIGHT, find_ids::RUN_6, find_ids::RUN_7,
    find_ids::SUITED_3, find_ids::SUITED_4, find_ids::SUITED_5,
    find_ids::SUITED_6, find_ids::SUITED_7, find_ids::SUITED_8,
};

constexpr std::array<std::string_view, 2> PERFECT_BLACKJACK_LOSERS = {
    find_ids::SUITED_BLACKJACK, find_ids::BLACKJACK,
};

constexpr std::array<std::string_view, 1> SUITED_BLACKJACK_LOSERS = {
    find_ids::BLACKJACK,
};

constexpr std::array<std::string_view, 1> TWO_QUADS_LOSERS = {
    find_ids::TWO_TRIPLES,
};

constexpr std::array<SuppressionRule, 5> RULES = {{
    {find_ids::ROYAL_FLUSH,       ROYAL_LOSERS},
    {find_ids::STRAIGHT_FLUSH,    STRAIGHT_FLUSH_LOSERS},
    {find_ids::PERFECT_BLACKJACK, PERFECT_BLACKJACK_LOSERS},
    {find_ids::SUITED_BLACKJACK,  SUITED_BLACKJACK_LOSERS},
    {find_ids::TWO_QUADS,         TWO_QUADS_LOSERS},
}};

/// Aggregate id → the member id it replaces.
constexpr std::array<std::pair<std::string_view, std::string_view>, 3> AGGREGATES = {{
    {find_ids::THREE_PAIRS, find_ids::PAIR},
    {find_ids::TWO_TRIPLES, find_ids::TRIPLE},
    {find_ids::TWO_QUADS,   find_ids::QUAD},
}};

bool has_id(const std::vector<Find>& finds, std::string_view id) {
    return std::any_of(finds.begin(), finds.end(),
                       [&](const Find& f) { return f.id == id; });
}

void erase_id(std::vector<Find>& finds, std::string_view id) {
    std::erase_if(finds, [&](const Find& f) { return f.id == id; });
}

} // anonymous namespace

// ─── Helpers ──────────────────────────────────────────────────────────────────

std::span<const SuppressionRule> Reconciler::rules() noexcept {
    return RULES;
}

bool Reconciler::positions_overlap(const Positions& a, const Positions& b) noexcept {
    return std::any_of(b.begin(), b.end(), [&](std::size_t p) {
        return std::find(a.begin(), a.end(), p) != a.end();
    });
}

// ─── Pass 1: aggregate subsumption ────────────────────────────────────────────

std::vector<Find> Reconciler::drop_aggregated(std::vector<Find> finds) {
    std::array<bool, AGGREGATES.size()> present{};
    for (std::size_t i = 0; i < AGGREGATES.size(); ++i) {
        present[i] = has_id(finds, AGGREGATES[i].first);
    }
    for (std::size_t i = 0; i < AGGREGATES.size(); ++i) {
        if (present[i]) {
            erase_id(finds, AGGREGATES[i].second);
        }
    }
    return finds;
}

// ─── Pass 2: cross-family suppression ─────────────────────────────────────────

std::vector<Find> Reconciler::apply_suppression(std::vector<Find> finds) {
    for (const auto& rule : RULES) {
        std::vector<Positions> winners;
        for (const auto& f : finds) {
            if (f.id == rule.winner) {
                winners.push_back(f.positions);
            }
        }
        if (winners.empty()) continue;

        std::erase_if(finds, [&](const Find& f) {
            const bool is_loser = std::find(rule.losers.begin(), rule.losers.end(), f.id)
                                  != rule.losers.end();
            if (!is_loser) return false;
            return std::any_of(winners.begin(), winners.end(), [&](const Positions& w) {
                return positions_overlap(w, f.positions);
            });
        });
    }
    return finds;
}

// ─── Pass 3: per-identifier dedup ─────────────────────────────────────────────

std::vector<Find> Reconciler::dedupe_by_id(std::vector<Find> finds) {
    std::vector<Find> best;
    best.reserve(finds.size());
    for (auto& f : finds) {
        auto it = std::find_if(best.begin(), best.end(),
                               [&](const Find& b) { return b.id == f.id; });
        if (it == best.end()) {
            best.push_back(std::move(f));
        } else if (f.positions.size() > it->positions.size()) {
            // Replace in place: the id keeps its first-seen slot.
            *it = std::move(f);
        }
    }
    return best;
}

std::vector<Find> Reconciler::reconcile(std::vector<Find> candidates) {
    return dedupe_by_id(apply_suppression(drop_aggregated(std::move(candidates))));
}

void Reconciler::sort_by_rarity(std::vector<Find>& finds) {
    std::stable_sort(finds.begin(), finds.end(), [](const Find& a, const Find& b) {
        return tier_order(a.tier) < tier_order(b.tier);
    });
}

} // namespace shuffled::reconcile
