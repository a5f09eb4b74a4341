/// @file src/detectors/run_scan.cpp
/// @brief Find construction helpers shared by the detectors.

#include "run_scan.hpp"

#include <numeric>
#include <utility>

namespace shuffled::detectors::detail {

Positions range_positions(std::size_t begin, std::size_t end) {
    Positions positions(end > begin ? end - begin : 0);
    std::iota(positions.begin(), positions.end(), begin);
    return positions;
}

Find make_find(std::string_view id,
               std::string      name,
               std::string_view icon,
               RarityTier       tier,
               Positions        positions) {
    return Find{
        .id        = std::string(id),
        .name      = std::move(name),
        .icon      = std::string(icon),
        .tier      = tier,
        .positions = std::move(positions),
    };
}

} // namespace shuffled::detectors::detail
