/// @file src/core/report.cpp
/// @brief Text and JSON renderings of engine output.

#include "shuffled/report.hpp"

#include "shuffled/rarity.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <string>
#include <utility>

namespace shuffled::report {

std::string to_json(std::span<const ReportedFind> finds) {
    // Field order is part of the output format.
    auto out = nlohmann::ordered_json::array();
    for (const auto& r : finds) {
        const Find& f = r.find;
        nlohmann::ordered_json entry;
        entry["id"]        = f.id;
        entry["name"]      = f.name;
        entry["icon"]      = f.icon;
        entry["color"]     = std::string(tier_color(f.tier));
        entry["rarity"]    = std::string(to_string(f.tier));
        entry["positions"] = f.positions;
        entry["isNew"]     = r.is_new;
        out.push_back(std::move(entry));
    }
    return out.dump();
}

std::string to_text(std::span<const ReportedFind> finds) {
    std::string out;
    for (const auto& r : finds) {
        out += fmt::format("{}{} {}\n", r.is_new ? "NEW " : "    ", r.find.icon,
                           r.find.to_string());
    }
    return out;
}

} // namespace shuffled::report
