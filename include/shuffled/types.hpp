#pragma once

/// @file include/shuffled/types.hpp
/// @brief Shared value types for the shuffled finds engine.
///
/// Every module includes this file. It defines the card attributes, the
/// parsed card and deck, the rarity tiers and the Find record produced by
/// the detectors.

#include <cstddef>
#include <string>
#include <vector>

namespace shuffled {

// ─── Card Attributes ──────────────────────────────────────────────────────────

/// Card rank. The underlying value is the numeric card value used by the
/// run detectors: Ace = 1, 2..10 literal, Jack = 11, Queen = 12, King = 13.
enum class Rank : int {
    Ace = 1,
    Two,
    Three,
    Four,
    Five,
    Six,
    Seven,
    Eight,
    Nine,
    Ten,
    Jack,
    Queen,
    King,
};

/// The four French suits. Tokens spell them ♠ ♥ ♦ ♣.
enum class Suit : int {
    Spades,
    Hearts,
    Diamonds,
    Clubs,
};

/// Hearts and Diamonds are red; Spades and Clubs are black.
enum class Color : int {
    Red,
    Black,
};

// ─── Rarity ───────────────────────────────────────────────────────────────────

/// Rarity tiers, rarest first. The declaration order is the sort order of
/// the engine's output.
enum class RarityTier : int {
    Legendary,
    Extraordinary,
    VeryRare,
    Rare,
    Uncommon,
    Common,
};

// ─── Card / Deck ──────────────────────────────────────────────────────────────

/// A parsed card token. Rank and suit determine every other field.
struct Card {
    Rank        rank;   ///< A, 2..10, J, Q, K
    Suit        suit;   ///< ♠ ♥ ♦ ♣
    Color       color;  ///< Derived from suit
    int         value;  ///< 1..13, equal to static_cast<int>(rank)
    std::string token;  ///< The token as given, e.g. "10♥"

    bool operator==(const Card&) const = default;
};

/// An ordered sequence of parsed cards. A validated deck holds exactly the
/// 52 distinct cards; position is the 0-based index into this vector.
using Deck = std::vector<Card>;

/// Deck indices occupied by a find.
using Positions = std::vector<std::size_t>;

// ─── Find ─────────────────────────────────────────────────────────────────────

/// One detected pattern instance.
struct Find {
    std::string id;         ///< Stable family+tier identifier, e.g. "suited-5"
    std::string name;       ///< Display name, e.g. "5 Hearts"
    std::string icon;       ///< Opaque display hint (UTF-8 glyph)
    RarityTier  tier;       ///< Rarity of this instance
    Positions   positions;  ///< Deck indices the pattern occupies (non-empty)

    /// "[Rare] 5 Hearts @ 10,11,12,13,14"
    [[nodiscard]] std::string to_string() const;

    bool operator==(const Find&) const = default;
};

/// A Find as handed to the caller, with the viewer-specific novelty flag
/// attached by the engine's collaborator.
struct ReportedFind {
    Find find;
    bool is_new = true;
};

} // namespace shuffled
