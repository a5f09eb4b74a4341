/// @file tests/detectors/test_window_detectors.cpp
/// @brief Tests for the fixed-width window detectors.

#include "shuffled/detectors.hpp"

#include "shuffled/constants.hpp"
#include "../support/deck_builders.hpp"

#include <gtest/gtest.h>

using namespace shuffled;
using namespace shuffled::detectors;
using shuffled::test_support::cards;

// ─── Blackjack ────────────────────────────────────────────────────────────────

TEST(BlackjackPairs, PerfectInEitherOrder) {
    for (const auto& deck : {cards({"A♠", "J♠"}), cards({"J♠", "A♠"})}) {
        const auto finds = blackjack_pairs(deck);
        ASSERT_EQ(finds.size(), 1u);
        EXPECT_EQ(finds[0].id, find_ids::PERFECT_BLACKJACK);
        EXPECT_EQ(finds[0].name, "Perfect Blackjack");
        EXPECT_EQ(finds[0].tier, RarityTier::Rare);
        EXPECT_EQ(finds[0].positions, (Positions{0, 1}));
    }
}

TEST(BlackjackPairs, SuitedAndPlain) {
    const auto suited = blackjack_pairs(cards({"A♥", "K♥"}));
    ASSERT_EQ(suited.size(), 1u);
    EXPECT_EQ(suited[0].id, find_ids::SUITED_BLACKJACK);
    EXPECT_EQ(suited[0].tier, RarityTier::Uncommon);

    const auto plain = blackjack_pairs(cards({"10♣", "A♦"}));
    ASSERT_EQ(plain.size(), 1u);
    EXPECT_EQ(plain[0].id, find_ids::BLACKJACK);
    EXPECT_EQ(plain[0].tier, RarityTier::Common);
}

TEST(BlackjackPairs, QueenOfSpadesWithAceOfSpadesIsOnlySuited) {
    const auto finds = blackjack_pairs(cards({"A♠", "Q♠"}));
    ASSERT_EQ(finds.size(), 1u);
    EXPECT_EQ(finds[0].id, find_ids::SUITED_BLACKJACK);
}

TEST(BlackjackPairs, OverlappingWindowsAllReported) {
    const auto finds = blackjack_pairs(cards({"K♣", "A♥", "Q♦"}));
    ASSERT_EQ(finds.size(), 2u);
    EXPECT_EQ(finds[0].positions, (Positions{0, 1}));
    EXPECT_EQ(finds[1].positions, (Positions{1, 2}));
}

TEST(BlackjackPairs, NoTenValue) {
    EXPECT_TRUE(blackjack_pairs(cards({"A♠", "A♥", "9♠"})).empty());
    EXPECT_TRUE(blackjack_pairs(cards({"A♠"})).empty());
}

// ─── Two Pair ─────────────────────────────────────────────────────────────────

TEST(TwoPairWindows, AABB) {
    const auto finds = two_pair_windows(cards({"3♦", "4♠", "4♥", "9♦", "9♣"}));
    ASSERT_EQ(finds.size(), 1u);
    EXPECT_EQ(finds[0].id, find_ids::TWO_PAIR);
    EXPECT_EQ(finds[0].tier, RarityTier::Rare);
    EXPECT_EQ(finds[0].positions, (Positions{1, 2, 3, 4}));
}

TEST(TwoPairWindows, FourOfAKindIsNotTwoPair) {
    EXPECT_TRUE(two_pair_windows(cards({"4♠", "4♥", "4♦", "4♣"})).empty());
}

TEST(TwoPairWindows, ABABIsNotTwoPair) {
    EXPECT_TRUE(two_pair_windows(cards({"4♠", "9♥", "4♦", "9♣"})).empty());
}

// ─── Full House ───────────────────────────────────────────────────────────────

TEST(FullHouseWindows, ThreeThenTwo) {
    const auto finds = full_house_windows(cards({"9♠", "9♥", "9♦", "4♣", "4♠"}));
    ASSERT_EQ(finds.size(), 1u);
    EXPECT_EQ(finds[0].id, find_ids::FULL_HOUSE);
    EXPECT_EQ(finds[0].name, "Full House");
    EXPECT_EQ(finds[0].tier, RarityTier::VeryRare);
    EXPECT_EQ(finds[0].positions, (Positions{0, 1, 2, 3, 4}));
}

TEST(FullHouseWindows, TwoThenThree) {
    const auto finds = full_house_windows(cards({"4♣", "4♠", "9♠", "9♥", "9♦"}));
    ASSERT_EQ(finds.size(), 1u);
}

TEST(FullHouseWindows, QuadPlusOneIsNotAFullHouse) {
    EXPECT_TRUE(full_house_windows(cards({"9♠", "9♥", "9♦", "9♣", "4♠"})).empty());
}

TEST(FullHouseWindows, ShorterThanWindow) {
    EXPECT_TRUE(full_house_windows(cards({"9♠", "9♥", "4♠", "4♥"})).empty());
}

// ─── Dead Man's Hand ──────────────────────────────────────────────────────────

TEST(DeadMansHand, TwoAcesTwoEightsAnyOrder) {
    const auto finds = dead_mans_hand(cards({"A♠", "8♣", "A♥", "8♦"}));
    ASSERT_EQ(finds.size(), 1u);
    EXPECT_EQ(finds[0].id, find_ids::DEAD_MANS_HAND);
    EXPECT_EQ(finds[0].name, "Dead Man's Hand");
    EXPECT_EQ(finds[0].tier, RarityTier::Extraordinary);
    EXPECT_EQ(finds[0].positions, (Positions{0, 1, 2, 3}));
}

TEST(DeadMansHand, SpreadOverFiveCardsDoesNotCount) {
    EXPECT_TRUE(dead_mans_hand(cards({"A♥", "8♣", "K♠", "A♦", "8♦"})).empty());
}

TEST(DeadMansHand, ThreeAcesDoesNotCount) {
    EXPECT_TRUE(dead_mans_hand(cards({"A♠", "A♥", "A♦", "8♦"})).empty());
}
