#pragma once

#include <cstddef>
#include <string_view>

/// @file include/shuffled/constants.hpp
/// @brief Deck geometry, detector thresholds and find identifiers.

namespace shuffled::constants {

// ─── Deck Geometry ────────────────────────────────────────────────────────────

/// Cards in a standard French deck.
static constexpr std::size_t DECK_SIZE = 52;

/// Ranks per suit.
static constexpr std::size_t RANKS_PER_SUIT = 13;

// ─── Detector Thresholds ──────────────────────────────────────────────────────

static constexpr std::size_t MIN_SUITED_STREAK      = 3;
static constexpr std::size_t MIN_RANK_RUN           = 3;
static constexpr std::size_t MIN_COLOR_STREAK       = 6;
static constexpr std::size_t MIN_ALTERNATING_RUN    = 7;
static constexpr std::size_t MIN_STRAIGHT_FLUSH     = 5;
static constexpr std::size_t MIN_SOLITAIRE_RUN      = 5;
static constexpr std::size_t MIN_FACTORY_RUN        = 4;
static constexpr std::size_t MIN_MIRRORS            = 3;
static constexpr std::size_t MIN_PAIRS_FOR_COUNT    = 3;
static constexpr std::size_t MIN_TRIPLES_FOR_COUNT  = 2;
static constexpr std::size_t MIN_QUADS_FOR_COUNT    = 2;

/// Card value that counts as ten for Blackjack (10, J, Q, K).
static constexpr int TEN_VALUE = 10;

/// Value of a King; a following Ace extends an ascending run as 14.
static constexpr int KING_VALUE = 13;

} // namespace shuffled::constants

namespace shuffled::find_ids {

inline constexpr std::string_view PAIR              = "pair";
inline constexpr std::string_view TRIPLE            = "triple";
inline constexpr std::string_view QUAD              = "quad";

inline constexpr std::string_view SUITED_3          = "suited-3";
inline constexpr std::string_view SUITED_4          = "suited-4";
inline constexpr std::string_view SUITED_5          = "suited-5";
inline constexpr std::string_view SUITED_6          = "suited-6";
inline constexpr std::string_view SUITED_7          = "suited-7";
inline constexpr std::string_view SUITED_8          = "suited-8";

inline constexpr std::string_view RUN_3             = "run-3";
inline constexpr std::string_view RUN_4             = "run-4";
inline constexpr std::string_view STRAIGHT          = "straight";
inline constexpr std::string_view RUN_6             = "run-6";
inline constexpr std::string_view RUN_7             = "run-7";

inline constexpr std::string_view COLOUR_6          = "colour-6";
inline constexpr std::string_view COLOUR_8          = "colour-8";
inline constexpr std::string_view COLOUR_10         = "colour-10";

inline constexpr std::string_view ALTERNATING_7     = "alternating-7";
inline constexpr std::string_view ALTERNATING_10    = "alternating-10";

inline constexpr std::string_view BLACKJACK         = "blackjack";
inline constexpr std::string_view SUITED_BLACKJACK  = "suited-blackjack";
inline constexpr std::string_view PERFECT_BLACKJACK = "perfect-blackjack";

inline constexpr std::string_view THREE_PAIRS       = "three-pairs";
inline constexpr std::string_view TWO_TRIPLES       = "two-triples";
inline constexpr std::string_view TWO_QUADS         = "two-quads";

inline constexpr std::string_view MIRROR            = "mirror";
inline constexpr std::string_view TWO_PAIR          = "two-pair";
inline constexpr std::string_view FULL_HOUSE        = "full-house";
inline constexpr std::string_view STRAIGHT_FLUSH    = "straight-flush";
inline constexpr std::string_view ROYAL_FLUSH       = "royal-flush";
inline constexpr std::string_view DEAD_MANS_HAND    = "dead-mans-hand";
inline constexpr std::string_view SOLITAIRE         = "solitaire-5";
inline constexpr std::string_view ACE_HIGH          = "ace-high";
inline constexpr std::string_view ASCENDING_TOP_5   = "ascending-top-5";
inline constexpr std::string_view FACTORY_RUN       = "factory-run";

} // namespace shuffled::find_ids
