#pragma once

/// @file tests/support/deck_builders.hpp
/// @brief Deck and card builders shared by the test suites.

#include "shuffled/card.hpp"
#include "shuffled/constants.hpp"
#include "shuffled/types.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace shuffled::test_support {

/// Parse a short card sequence. Fails the current test on a bad token.
inline Deck cards(std::initializer_list<std::string_view> tokens) {
    Deck out;
    for (const auto token : tokens) {
        const auto card = parse_card(token);
        EXPECT_TRUE(card.has_value()) << "bad test token " << token;
        if (card) out.push_back(*card);
    }
    return out;
}

/// A 52-card permutation with no finds at all.
///
/// Position j holds card k = (j + 1) mod 52 with rank index 5k mod 13 and
/// suit index k mod 4, so neighbours never share a rank, a suit or a
/// ±1 value, and colours change every two cards.
inline std::vector<std::string> quiet_deck() {
    static constexpr std::array<std::string_view, 13> RANKS = {
        "A", "2", "3", "4", "5", "6", "7", "8", "9", "10", "J", "Q", "K",
    };
    static constexpr std::array<std::string_view, 4> SUITS = {"♠", "♥", "♦", "♣"};

    std::vector<std::string> deck;
    deck.reserve(constants::DECK_SIZE);
    for (std::size_t j = 0; j < constants::DECK_SIZE; ++j) {
        const std::size_t k = (j + 1) % constants::DECK_SIZE;
        std::string token(RANKS[(5 * k) % 13]);
        token += SUITS[k % 4];
        deck.push_back(std::move(token));
    }
    return deck;
}

/// The quiet deck with `block` moved, in order, to start at position `at`.
/// The remaining cards keep their relative order.
inline std::vector<std::string> deck_with_block(std::vector<std::string> block,
                                                std::size_t              at) {
    std::vector<std::string> rest;
    for (auto& token : quiet_deck()) {
        if (std::find(block.begin(), block.end(), token) == block.end()) {
            rest.push_back(std::move(token));
        }
    }
    rest.insert(rest.begin() + static_cast<std::ptrdiff_t>(at), block.begin(), block.end());
    return rest;
}

/// First find with the given id, if any.
inline std::optional<Find> find_by_id(const std::vector<Find>& finds, std::string_view id) {
    for (const auto& f : finds) {
        if (f.id == id) return f;
    }
    return std::nullopt;
}

inline std::optional<Find> find_by_id(const std::vector<ReportedFind>& finds,
                                      std::string_view                 id) {
    for (const auto& r : finds) {
        if (r.find.id == id) return r.find;
    }
    return std::nullopt;
}

/// Number of finds with the given id.
inline std::size_t count_id(const std::vector<Find>& finds, std::string_view id) {
    return static_cast<std::size_t>(std::count_if(
        finds.begin(), finds.end(), [&](const Find& f) { return f.id == id; }));
}

inline std::size_t count_id(const std::vector<ReportedFind>& finds, std::string_view id) {
    return static_cast<std::size_t>(std::count_if(
        finds.begin(), finds.end(), [&](const ReportedFind& r) { return r.find.id == id; }));
}

} // namespace shuffled::test_support
