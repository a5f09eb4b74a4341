/// @file src/core/engine.cpp
/// @brief Finds Engine: detector orchestration, reconciliation and ranking.

#include "shuffled/engine.hpp"

#include "shuffled/detectors.hpp"
#include "shuffled/reconciler.hpp"

#include <fmt/core.h>

#include <iterator>
#include <utility>

namespace shuffled::core {

using reconcile::Reconciler;

// ─── Construction ─────────────────────────────────────────────────────────────

Engine::Engine(EngineConfig config) : config_(std::move(config)) {}

// ─── Engine::collect_candidates ───────────────────────────────────────────────

std::vector<Find> Engine::collect_candidates(const Deck& deck, bool verbose) {
    namespace d = detectors;

    std::vector<std::string> tokens;
    tokens.reserve(deck.size());
    for (const auto& card : deck) {
        tokens.push_back(card.token);
    }

    std::vector<Find> all;
    const auto append = [&](std::string_view detector, d::Candidates found) {
        if (verbose) {
            fmt::print(stderr, "  {:<20} {:2d} candidate(s)\n", detector, found.size());
        }
        all.insert(all.end(),
                   std::make_move_iterator(found.begin()),
                   std::make_move_iterator(found.end()));
    };

    // The counting aggregate reads the same-rank result, nothing else.
    auto same_rank = d::same_rank_groups(deck);
    auto counting = d::counting_finds(same_rank);

    append("same-rank",      std::move(same_rank));
    append("suited",         d::suited_streaks(deck));
    append("runs",           d::rank_runs(deck));
    append("colour",         d::color_streaks(deck));
    append("alternating",    d::alternating_colors(deck));
    append("blackjack",      d::blackjack_pairs(deck));
    append("counting",       std::move(counting));
    append("mirror",         d::mirror_symmetry(deck));
    append("two-pair",       d::two_pair_windows(deck));
    append("full-house",     d::full_house_windows(deck));
    append("straight-flush", d::straight_flushes(deck));
    append("dead-mans-hand", d::dead_mans_hand(deck));
    append("solitaire",      d::solitaire_runs(deck));
    append("ace-high",       d::ace_high(deck));
    append("ascending-top",  d::ascending_top_five(deck));
    append("factory-run",    d::factory_runs(tokens));

    return all;
}

// ─── Engine::detect_parsed ────────────────────────────────────────────────────

std::vector<ReportedFind> Engine::detect_parsed(const Deck& deck) const {
    if (config_.verbose) {
        fmt::print(stderr, "detect: scanning {} cards\n", deck.size());
    }

    auto finds = Reconciler::reconcile(collect_candidates(deck, config_.verbose));
    Reconciler::sort_by_rarity(finds);

    if (config_.verbose) {
        fmt::print(stderr, "detect: {} find(s) after reconciliation\n", finds.size());
    }

    std::vector<ReportedFind> reported;
    reported.reserve(finds.size());
    for (auto& f : finds) {
        const bool is_new = config_.novelty ? config_.novelty(f) : true;
        reported.push_back(ReportedFind{std::move(f), is_new});
    }
    return reported;
}

// ─── Engine::detect ───────────────────────────────────────────────────────────

std::vector<ReportedFind> Engine::detect(std::span<const std::string> tokens) const {
    return detect_parsed(parse_deck(tokens));
}

std::optional<std::vector<ReportedFind>>
Engine::try_detect(std::span<const std::string> tokens) const {
    if (validate_deck(tokens)) {
        return std::nullopt;
    }
    return detect(tokens);
}

} // namespace shuffled::core
