/// @file src/card/factory.cpp
/// @brief Factory order helpers and position-wise deck comparison.

#include "shuffled/factory.hpp"

#include <algorithm>
#include <utility>

namespace shuffled::factory {

std::vector<std::string> factory_deck() {
    return {FACTORY_ORDER.begin(), FACTORY_ORDER.end()};
}

std::size_t count_factory_positions(std::span<const std::string> deck) noexcept {
    const std::size_t n = std::min(deck.size(), FACTORY_ORDER.size());
    std::size_t count = 0;
    for (std::size_t i = 0; i < n; ++i) {
        if (deck[i] == FACTORY_ORDER[i]) {
            ++count;
        }
    }
    return count;
}

DeckMatch compare_decks(std::span<const std::string> a,
                        std::span<const std::string> b) {
    DeckMatch match;
    const std::size_t n = std::min(a.size(), b.size());
    for (std::size_t i = 0; i < n; ++i) {
        if (a[i] == b[i]) {
            match.positions.push_back(i);
        }
    }
    match.count = match.positions.size();
    return match;
}

std::optional<ClosestMatch>
closest_match(std::span<const std::string>              deck,
              std::span<const std::vector<std::string>> history) {
    std::optional<ClosestMatch> best;
    for (std::size_t i = 0; i < history.size(); ++i) {
        auto match = compare_decks(deck, history[i]);
        if (!best || match.count > best->match.count) {
            best = ClosestMatch{i, std::move(match)};
        }
    }
    return best;
}

} // namespace shuffled::factory
