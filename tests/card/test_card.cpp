/// @file tests/card/test_card.cpp
/// @brief Tests for token parsing, deck validation and the display helpers.

#include "shuffled/card.hpp"
#include "shuffled/constants.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include <string>
#include <utility>
#include <vector>

using namespace shuffled;
using namespace shuffled::constants;

// ─── parse_card ───────────────────────────────────────────────────────────────

TEST(ParseCard, AceOfSpades) {
    const auto card = parse_card("A♠");
    ASSERT_TRUE(card.has_value());
    EXPECT_EQ(card->rank, Rank::Ace);
    EXPECT_EQ(card->suit, Suit::Spades);
    EXPECT_EQ(card->color, Color::Black);
    EXPECT_EQ(card->value, 1);
    EXPECT_EQ(card->token, "A♠");
}

TEST(ParseCard, TenOfHearts_TwoCharacterRank) {
    const auto card = parse_card("10♥");
    ASSERT_TRUE(card.has_value());
    EXPECT_EQ(card->rank, Rank::Ten);
    EXPECT_EQ(card->suit, Suit::Hearts);
    EXPECT_EQ(card->color, Color::Red);
    EXPECT_EQ(card->value, 10);
}

TEST(ParseCard, FaceCardValues) {
    EXPECT_EQ(parse_card("J♦")->value, 11);
    EXPECT_EQ(parse_card("Q♣")->value, 12);
    EXPECT_EQ(parse_card("K♦")->value, 13);
}

TEST(ParseCard, SuitColours) {
    EXPECT_EQ(parse_card("7♠")->color, Color::Black);
    EXPECT_EQ(parse_card("7♣")->color, Color::Black);
    EXPECT_EQ(parse_card("7♥")->color, Color::Red);
    EXPECT_EQ(parse_card("7♦")->color, Color::Red);
}

TEST(ParseCard, RejectsMalformedTokens) {
    EXPECT_FALSE(parse_card("").has_value());
    EXPECT_FALSE(parse_card("♠").has_value());
    EXPECT_FALSE(parse_card("A").has_value());
    EXPECT_FALSE(parse_card("1♠").has_value());
    EXPECT_FALSE(parse_card("11♠").has_value());
    EXPECT_FALSE(parse_card("a♠").has_value());
    EXPECT_FALSE(parse_card("AS").has_value());
    EXPECT_FALSE(parse_card(" A♠").has_value());
    EXPECT_FALSE(parse_card("A♠ ").has_value());
    EXPECT_FALSE(parse_card("A♠♠").has_value());
}

TEST(ParseCard, EveryStandardTokenParses) {
    for (const auto& token : standard_deck()) {
        const auto card = parse_card(token);
        ASSERT_TRUE(card.has_value()) << token;
        EXPECT_EQ(card->token, token);
        EXPECT_EQ(card->value, static_cast<int>(card->rank));
        EXPECT_EQ(card->color, color_of(card->suit));
    }
}

// ─── card_index / standard_deck ───────────────────────────────────────────────

TEST(StandardDeck, FiftyTwoDistinctIndices) {
    const auto deck = standard_deck();
    ASSERT_EQ(deck.size(), DECK_SIZE);

    std::set<std::size_t> indices;
    for (const auto& token : deck) {
        indices.insert(card_index(*parse_card(token)));
    }
    EXPECT_EQ(indices.size(), DECK_SIZE);
    EXPECT_EQ(*indices.begin(), 0u);
    EXPECT_EQ(*indices.rbegin(), DECK_SIZE - 1);
}

TEST(StandardDeck, SuitMajorOrder) {
    const auto deck = standard_deck();
    EXPECT_EQ(deck.front(), "A♠");
    EXPECT_EQ(deck[12], "K♠");
    EXPECT_EQ(deck[13], "A♥");
    EXPECT_EQ(deck.back(), "K♣");
}

// ─── validate_deck ────────────────────────────────────────────────────────────

TEST(ValidateDeck, StandardDeckIsValid) {
    EXPECT_FALSE(validate_deck(standard_deck()).has_value());
}

TEST(ValidateDeck, ReversedDeckIsValid) {
    auto deck = standard_deck();
    std::reverse(deck.begin(), deck.end());
    EXPECT_FALSE(validate_deck(deck).has_value());
}

TEST(ValidateDeck, FiftyOneCards_WrongCardinality) {
    auto deck = standard_deck();
    deck.pop_back();
    const auto error = validate_deck(deck);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, DeckErrorKind::WrongCardinality);
    EXPECT_EQ(error->position, 51u);
    EXPECT_EQ(error->message(), "deck has 51 cards, expected 52");
}

TEST(ValidateDeck, EmptyDeck_WrongCardinality) {
    const std::vector<std::string> empty;
    const auto error = validate_deck(empty);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, DeckErrorKind::WrongCardinality);
}

TEST(ValidateDeck, CardinalityCheckedBeforeTokens) {
    std::vector<std::string> deck(53, "garbage");
    const auto error = validate_deck(deck);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, DeckErrorKind::WrongCardinality);
}

TEST(ValidateDeck, UnrecognizedToken_ReportsFirstPosition) {
    auto deck = standard_deck();
    deck[7]  = "X♠";
    deck[30] = "Z";
    const auto error = validate_deck(deck);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, DeckErrorKind::UnrecognizedToken);
    EXPECT_EQ(error->position, 7u);
    EXPECT_EQ(error->token, "X♠");
    EXPECT_EQ(error->message(), "unrecognized token 'X♠' at position 7");
}

TEST(ValidateDeck, DuplicateCard_ReportsSecondOccurrence) {
    auto deck = standard_deck();
    deck[20] = "Q♦";  // Q♦ also sits at 37
    const auto error = validate_deck(deck);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, DeckErrorKind::DuplicateCard);
    EXPECT_EQ(error->position, 37u);
    EXPECT_EQ(error->token, "Q♦");
}

// ─── parse_deck ───────────────────────────────────────────────────────────────

TEST(ParseDeck, PreservesOrderAndLength) {
    auto tokens = standard_deck();
    std::swap(tokens[0], tokens[51]);
    const Deck deck = parse_deck(tokens);
    ASSERT_EQ(deck.size(), DECK_SIZE);
    EXPECT_EQ(deck.front().token, "K♣");
    EXPECT_EQ(deck.back().token, "A♠");
}

TEST(ParseDeck, ThrowsInvalidDeckWithError) {
    auto tokens = standard_deck();
    tokens[3] = "4♠ ";
    try {
        (void)parse_deck(tokens);
        FAIL() << "expected InvalidDeck";
    } catch (const InvalidDeck& e) {
        EXPECT_EQ(e.error().kind, DeckErrorKind::UnrecognizedToken);
        EXPECT_EQ(e.error().position, 3u);
        EXPECT_EQ(std::string(e.what()), e.error().message());
    }
}

TEST(ParseDeck, InvalidDeckIsAnInvalidArgument) {
    const std::vector<std::string> tokens = {"A♠"};
    EXPECT_THROW((void)parse_deck(tokens), std::invalid_argument);
}

// ─── Display Helpers ──────────────────────────────────────────────────────────

TEST(CardDisplay, RankStrings) {
    EXPECT_EQ(to_string(Rank::Ace), "A");
    EXPECT_EQ(to_string(Rank::Ten), "10");
    EXPECT_EQ(to_string(Rank::King), "K");
}

TEST(CardDisplay, RankPlurals) {
    EXPECT_EQ(rank_plural(Rank::Ace), "Aces");
    EXPECT_EQ(rank_plural(Rank::Seven), "7s");
    EXPECT_EQ(rank_plural(Rank::Ten), "10s");
    EXPECT_EQ(rank_plural(Rank::Jack), "Jacks");
    EXPECT_EQ(rank_plural(Rank::Queen), "Queens");
    EXPECT_EQ(rank_plural(Rank::King), "Kings");
}

TEST(CardDisplay, SuitSymbolsAndNames) {
    EXPECT_EQ(suit_symbol(Suit::Hearts), "♥");
    EXPECT_EQ(suit_symbol(Suit::Clubs), "♣");
    EXPECT_EQ(suit_name(Suit::Diamonds), "Diamonds");
    EXPECT_EQ(suit_name(Suit::Spades), "Spades");
}

TEST(CardDisplay, ColourLabels) {
    EXPECT_EQ(to_string(Color::Red), "red");
    EXPECT_EQ(to_string(Color::Black), "black");
}

TEST(CardDisplay, ErrorKindLabels) {
    EXPECT_EQ(to_string(DeckErrorKind::DuplicateCard), "duplicate card");
    EXPECT_EQ(to_string(DeckErrorKind::WrongCardinality), "wrong cardinality");
}
