/// @file src/card/rarity.cpp
/// @brief Rarity tier labels and badge colours.

#include "shuffled/rarity.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace shuffled {

namespace {

constexpr std::array<std::string_view, RARITY_ORDER.size()> TIER_LABELS = {
    "Legendary", "Extraordinary", "Very Rare", "Rare", "Uncommon", "Common",
};

constexpr std::array<std::string_view, RARITY_ORDER.size()> TIER_COLORS = {
    "#fbbf24",  // gold
    "#fb7185",  // rose
    "#a78bfa",  // purple
    "#60a5fa",  // blue
    "#34d399",  // green
    "#6b7280",  // grey
};

} // anonymous namespace

std::string_view to_string(RarityTier tier) noexcept {
    return TIER_LABELS[static_cast<std::size_t>(tier_order(tier))];
}

std::optional<RarityTier> tier_from_string(std::string_view label) noexcept {
    for (const RarityTier tier : RARITY_ORDER) {
        if (to_string(tier) == label) {
            return tier;
        }
    }
    return std::nullopt;
}

std::string_view tier_color(RarityTier tier) noexcept {
    return TIER_COLORS[static_cast<std::size_t>(tier_order(tier))];
}

// ─── Find ─────────────────────────────────────────────────────────────────────

std::string Find::to_string() const {
    return fmt::format("[{}] {} @ {}",
                       shuffled::to_string(tier), name,
                       fmt::join(positions, ","));
}

} // namespace shuffled
