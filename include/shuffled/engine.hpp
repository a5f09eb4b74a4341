#pragma once

/// @file include/shuffled/engine.hpp
/// @brief Finds Engine: public entry point of the detection pipeline.
///
/// # Module: Engine
///
/// ## Responsibility
/// Orchestrate one detection run:
///   tokens → parse_deck → 16 detectors → Reconciler → rarity sort → novelty
///
/// ## Usage
/// ```cpp
/// Engine engine;
/// auto finds = engine.detect(tokens);  // throws InvalidDeck
/// for (const auto& f : finds) fmt::print("{}\n", f.find.to_string());
/// ```
///
/// ## Guarantees
/// - Validation happens before any detector runs
/// - Output is sorted rarest-first; equal tiers keep reconciliation order
/// - Thread-safe: `detect` is const and touches no shared mutable state
///
/// ## NOT Responsible For
/// - Knowing who is looking: novelty is answered by the caller's callback

#include "shuffled/card.hpp"
#include "shuffled/types.hpp"

#include <functional>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace shuffled::core {

// ─── EngineConfig ─────────────────────────────────────────────────────────────

/// Configuration for the finds engine.
struct EngineConfig {
    /// If true, report per-detector candidate counts to stderr.
    bool verbose = false;

    /// Per-viewer novelty oracle supplied by the history store. When empty,
    /// every reported find is marked new.
    std::function<bool(const Find&)> novelty{};
};

// ─── Engine ───────────────────────────────────────────────────────────────────

class Engine {
public:
    explicit Engine(EngineConfig config = EngineConfig{});

    /// Validate, detect, reconcile and sort.
    ///
    /// @throws InvalidDeck if `tokens` is not a permutation of the deck.
    [[nodiscard]] std::vector<ReportedFind>
    detect(std::span<const std::string> tokens) const;

    /// As `detect`, but returns nullopt for an invalid deck.
    ///
    /// Only deck validation is mapped to nullopt; an exception thrown by the
    /// `novelty` callback propagates to the caller.
    [[nodiscard]] std::optional<std::vector<ReportedFind>>
    try_detect(std::span<const std::string> tokens) const;

    /// Run the pipeline on a deck already produced by `parse_deck`.
    [[nodiscard]] std::vector<ReportedFind> detect_parsed(const Deck& deck) const;

    /// All raw candidates in fixed detector order, before reconciliation.
    [[nodiscard]] static std::vector<Find>
    collect_candidates(const Deck& deck, bool verbose = false);

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    EngineConfig config_;
};

} // namespace shuffled::core
