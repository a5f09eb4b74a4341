#pragma once

/// @file include/shuffled/card.hpp
/// @brief Card Model: token parsing, deck validation and display helpers.
///
/// # Module: Card Model
///
/// ## Responsibility
/// Turn card tokens ("A♠", "10♥", "Q♦") into structured Card values and
/// check that a token sequence is a permutation of the standard deck before
/// any detector sees it.
///
/// ## Token Format
/// A rank string ("A", "2".."10", "J", "Q", "K") immediately followed by one
/// UTF-8 suit symbol (♠ ♥ ♦ ♣). Nothing else is accepted: no whitespace, no
/// lower-case ranks, no ASCII suit letters.
///
/// ## Guarantees
/// - `parse_card` and `validate_deck` never throw
/// - `parse_deck` either returns exactly 52 distinct cards in input order or
///   throws `InvalidDeck`

#include "shuffled/types.hpp"

#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace shuffled {

// ─── Deck Errors ──────────────────────────────────────────────────────────────

/// Why a token sequence is not a valid deck.
enum class DeckErrorKind {
    WrongCardinality,   ///< Not exactly 52 tokens
    UnrecognizedToken,  ///< A token that does not parse as a card
    DuplicateCard,      ///< The same card appears twice
};

/// First violation found in a token sequence.
struct DeckError {
    DeckErrorKind kind;
    std::size_t   position;  ///< Offending index; the token count for WrongCardinality
    std::string   token;     ///< Offending token; empty for WrongCardinality

    /// Human-readable description, e.g. "duplicate card 'Q♦' at position 17".
    [[nodiscard]] std::string message() const;
};

/// Raised by the validating entry points when the input is not a permutation
/// of the standard 52-card deck.
class InvalidDeck : public std::invalid_argument {
public:
    explicit InvalidDeck(DeckError error);

    [[nodiscard]] const DeckError& error() const noexcept { return error_; }

private:
    DeckError error_;
};

[[nodiscard]] std::string_view to_string(DeckErrorKind kind) noexcept;

// ─── Parsing ──────────────────────────────────────────────────────────────────

/// Parse a single token. Returns nullopt for anything that is not a rank
/// string followed by exactly one suit symbol.
[[nodiscard]] std::optional<Card> parse_card(std::string_view token) noexcept;

/// Check that `tokens` is a permutation of the standard deck.
///
/// Checks run in order: cardinality, then each token left to right for
/// recognition and duplication. Returns the first violation, or nullopt.
[[nodiscard]] std::optional<DeckError>
validate_deck(std::span<const std::string> tokens) noexcept;

/// Parse a full deck, preserving order and length.
///
/// @throws InvalidDeck if validate_deck reports a violation.
[[nodiscard]] Deck parse_deck(std::span<const std::string> tokens);

/// Unique index in [0, 52) for a card: suit-major, Ace..King within a suit.
[[nodiscard]] std::size_t card_index(const Card& card) noexcept;

/// The unshuffled deck: ♠ ♥ ♦ ♣, each Ace through King.
[[nodiscard]] std::vector<std::string> standard_deck();

// ─── Display Helpers ──────────────────────────────────────────────────────────

/// "A", "2".."10", "J", "Q", "K".
[[nodiscard]] std::string_view to_string(Rank rank) noexcept;

/// "red" / "black".
[[nodiscard]] std::string_view to_string(Color color) noexcept;

/// "♠", "♥", "♦", "♣".
[[nodiscard]] std::string_view suit_symbol(Suit suit) noexcept;

/// "Spades", "Hearts", "Diamonds", "Clubs".
[[nodiscard]] std::string_view suit_name(Suit suit) noexcept;

/// "Aces", "7s", "10s", "Kings".
[[nodiscard]] std::string_view rank_plural(Rank rank) noexcept;

/// Red for Hearts and Diamonds, black otherwise.
[[nodiscard]] constexpr Color color_of(Suit suit) noexcept {
    return (suit == Suit::Hearts || suit == Suit::Diamonds) ? Color::Red
                                                            : Color::Black;
}

} // namespace shuffled
