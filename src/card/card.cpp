/// @file src/card/card.cpp
/// @brief Card Model: token parsing and deck validation.

#include "shuffled/card.hpp"
#include "shuffled/constants.hpp"

#include <fmt/format.h>

#include <array>
#include <utility>

namespace shuffled {

namespace {

constexpr std::array<std::string_view, constants::RANKS_PER_SUIT> RANK_STRINGS = {
    "A", "2", "3", "4", "5", "6", "7", "8", "9", "10", "J", "Q", "K",
};

constexpr std::array<std::string_view, constants::RANKS_PER_SUIT> RANK_PLURALS = {
    "Aces", "2s", "3s", "4s", "5s", "6s", "7s", "8s", "9s", "10s",
    "Jacks", "Queens", "Kings",
};

constexpr std::array<Suit, 4> ALL_SUITS = {
    Suit::Spades, Suit::Hearts, Suit::Diamonds, Suit::Clubs,
};

constexpr std::array<std::string_view, 4> SUIT_SYMBOLS = {"♠", "♥", "♦", "♣"};
constexpr std::array<std::string_view, 4> SUIT_NAMES   = {"Spades", "Hearts", "Diamonds", "Clubs"};

std::size_t rank_slot(Rank rank) noexcept {
    return static_cast<std::size_t>(static_cast<int>(rank) - 1);
}

std::size_t suit_slot(Suit suit) noexcept {
    return static_cast<std::size_t>(suit);
}

std::optional<Rank> parse_rank(std::string_view text) noexcept {
    for (std::size_t i = 0; i < RANK_STRINGS.size(); ++i) {
        if (RANK_STRINGS[i] == text) {
            return static_cast<Rank>(static_cast<int>(i) + 1);
        }
    }
    return std::nullopt;
}

} // anonymous namespace

// ─── DeckError / InvalidDeck ──────────────────────────────────────────────────

std::string_view to_string(DeckErrorKind kind) noexcept {
    switch (kind) {
        case DeckErrorKind::WrongCardinality:  return "wrong cardinality";
        case DeckErrorKind::UnrecognizedToken: return "unrecognized token";
        case DeckErrorKind::DuplicateCard:     return "duplicate card";
    }
    return "unknown";
}

std::string DeckError::message() const {
    switch (kind) {
        case DeckErrorKind::WrongCardinality:
            return fmt::format("deck has {} cards, expected {}",
                               position, constants::DECK_SIZE);
        case DeckErrorKind::UnrecognizedToken:
            return fmt::format("unrecognized token '{}' at position {}",
                               token, position);
        case DeckErrorKind::DuplicateCard:
            return fmt::format("duplicate card '{}' at position {}",
                               token, position);
    }
    return "invalid deck";
}

InvalidDeck::InvalidDeck(DeckError error)
    : std::invalid_argument(error.message()), error_(std::move(error)) {}

// ─── Parsing ──────────────────────────────────────────────────────────────────

std::optional<Card> parse_card(std::string_view token) noexcept {
    for (const Suit suit : ALL_SUITS) {
        const std::string_view symbol = SUIT_SYMBOLS[suit_slot(suit)];
        if (token.size() <= symbol.size() || !token.ends_with(symbol)) {
            continue;
        }
        const auto rank = parse_rank(token.substr(0, token.size() - symbol.size()));
        if (!rank) {
            return std::nullopt;
        }
        return Card{
            .rank  = *rank,
            .suit  = suit,
            .color = color_of(suit),
            .value = static_cast<int>(*rank),
            .token = std::string(token),
        };
    }
    return std::nullopt;
}

std::size_t card_index(const Card& card) noexcept {
    return suit_slot(card.suit) * constants::RANKS_PER_SUIT + rank_slot(card.rank);
}

std::optional<DeckError>
validate_deck(std::span<const std::string> tokens) noexcept {
    if (tokens.size() != constants::DECK_SIZE) {
        return DeckError{DeckErrorKind::WrongCardinality, tokens.size(), {}};
    }

    std::array<bool, constants::DECK_SIZE> seen{};
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        const auto card = parse_card(tokens[i]);
        if (!card) {
            return DeckError{DeckErrorKind::UnrecognizedToken, i, tokens[i]};
        }
        const std::size_t idx = card_index(*card);
        if (seen[idx]) {
            return DeckError{DeckErrorKind::DuplicateCard, i, tokens[i]};
        }
        seen[idx] = true;
    }
    return std::nullopt;
}

Deck parse_deck(std::span<const std::string> tokens) {
    if (auto error = validate_deck(tokens)) {
        throw InvalidDeck(std::move(*error));
    }

    Deck deck;
    deck.reserve(tokens.size());
    for (const auto& token : tokens) {
        // validate_deck has already accepted every token.
        deck.push_back(*parse_card(token));
    }
    return deck;
}

std::vector<std::string> standard_deck() {
    std::vector<std::string> deck;
    deck.reserve(constants::DECK_SIZE);
    for (const Suit suit : ALL_SUITS) {
        for (const auto rank : RANK_STRINGS) {
            std::string token(rank);
            token += SUIT_SYMBOLS[suit_slot(suit)];
            deck.push_back(std::move(token));
        }
    }
    return deck;
}

// ─── Display Helpers ──────────────────────────────────────────────────────────

std::string_view to_string(Rank rank) noexcept {
    return RANK_STRINGS[rank_slot(rank)];
}

std::string_view to_string(Color color) noexcept {
    return color == Color::Red ? "red" : "black";
}

std::string_view suit_symbol(Suit suit) noexcept {
    return SUIT_SYMBOLS[suit_slot(suit)];
}

std::string_view suit_name(Suit suit) noexcept {
    return SUIT_NAMES[suit_slot(suit)];
}

std::string_view rank_plural(Rank rank) noexcept {
    return RANK_PLURALS[rank_slot(rank)];
}

} // namespace shuffled
