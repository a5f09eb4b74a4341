#pragma once

/// @file include/shuffled/factory.hpp
/// @brief Factory order reference deck and position-wise deck comparison.
///
/// # Module: Factory
///
/// ## Responsibility
/// Own the as-manufactured card order shared by the Factory Run detector and
/// the service's "cards still in factory position" statistic, plus the pure
/// comparison used to find the closest previously-seen shuffle.
///
/// ## NOT Responsible For
/// - Storing previous shuffles (the caller passes the history in)
/// - Producing random permutations

#include "shuffled/constants.hpp"
#include "shuffled/types.hpp"

#include <array>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace shuffled::factory {

/// A new Bicycle deck: Spades A-K, Diamonds A-K, Clubs K-A, Hearts K-A.
inline constexpr std::array<std::string_view, constants::DECK_SIZE> FACTORY_ORDER = {
    "A♠", "2♠", "3♠", "4♠", "5♠", "6♠", "7♠", "8♠", "9♠", "10♠", "J♠", "Q♠", "K♠",
    "A♦", "2♦", "3♦", "4♦", "5♦", "6♦", "7♦", "8♦", "9♦", "10♦", "J♦", "Q♦", "K♦",
    "K♣", "Q♣", "J♣", "10♣", "9♣", "8♣", "7♣", "6♣", "5♣", "4♣", "3♣", "2♣", "A♣",
    "K♥", "Q♥", "J♥", "10♥", "9♥", "8♥", "7♥", "6♥", "5♥", "4♥", "3♥", "2♥", "A♥",
};

/// FACTORY_ORDER as owned strings, ready to feed to the engine.
[[nodiscard]] std::vector<std::string> factory_deck();

/// Number of positions i where deck[i] equals FACTORY_ORDER[i].
/// Positions beyond either sequence's end are ignored.
[[nodiscard]] std::size_t
count_factory_positions(std::span<const std::string> deck) noexcept;

// ─── Deck Comparison ──────────────────────────────────────────────────────────

/// Position-wise agreement between two decks.
struct DeckMatch {
    std::size_t count = 0;  ///< Number of equal positions
    Positions   positions;  ///< The equal positions, ascending
};

/// Best agreement of one deck against a history of decks.
struct ClosestMatch {
    std::size_t index;  ///< Index into the history
    DeckMatch   match;
};

/// Compare two decks position by position over their common length.
[[nodiscard]] DeckMatch compare_decks(std::span<const std::string> a,
                                      std::span<const std::string> b);

/// The history entry sharing the most positions with `deck`; the earliest
/// entry wins ties. Returns nullopt when `history` is empty.
[[nodiscard]] std::optional<ClosestMatch>
closest_match(std::span<const std::string>             deck,
              std::span<const std::vector<std::string>> history);

} // namespace shuffled::factory
