#pragma once

/// @file include/shuffled/rarity.hpp
/// @brief Rarity tier metadata: ordering, labels and badge colours.

#include "shuffled/types.hpp"

#include <array>
#include <optional>
#include <string_view>

namespace shuffled {

/// All tiers, rarest first.
inline constexpr std::array<RarityTier, 6> RARITY_ORDER = {
    RarityTier::Legendary,
    RarityTier::Extraordinary,
    RarityTier::VeryRare,
    RarityTier::Rare,
    RarityTier::Uncommon,
    RarityTier::Common,
};

/// Sort key: 0 for Legendary through 5 for Common.
[[nodiscard]] inline constexpr int tier_order(RarityTier tier) noexcept {
    return static_cast<int>(tier);
}

/// "Legendary", "Extraordinary", "Very Rare", "Rare", "Uncommon", "Common".
[[nodiscard]] std::string_view to_string(RarityTier tier) noexcept;

/// Inverse of to_string. Returns nullopt for any other text.
[[nodiscard]] std::optional<RarityTier> tier_from_string(std::string_view label) noexcept;

/// Badge colour as "#rrggbb".
[[nodiscard]] std::string_view tier_color(RarityTier tier) noexcept;

} // namespace shuffled
