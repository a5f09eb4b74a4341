#pragma once

/// @file include/shuffled/report.hpp
/// @brief Text and JSON renderings of engine output.

#include "shuffled/types.hpp"

#include <span>
#include <string>

namespace shuffled::report {

/// Compact JSON array of {id, name, icon, color, rarity, positions, isNew},
/// fields in that order. UTF-8 is written unescaped.
[[nodiscard]] std::string to_json(std::span<const ReportedFind> finds);

/// One line per find, "NEW " prefix on novel finds.
[[nodiscard]] std::string to_text(std::span<const ReportedFind> finds);

} // namespace shuffled::report
