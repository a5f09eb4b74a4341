/// @file src/core/deck_loader.cpp
/// @brief DeckLoader: deck description tokeniser.

#include "shuffled/deck_loader.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <utility>

namespace shuffled::core {

namespace {

/// True for a line that is blank or whose first non-blank character is `#`.
bool is_skippable_line(std::string_view line) noexcept {
    const auto first = line.find_first_not_of(" \t\r");
    return first == std::string_view::npos || line[first] == '#';
}

} // anonymous namespace

// ─── DeckLoader::is_separator ─────────────────────────────────────────────────

bool DeckLoader::is_separator(char c) noexcept {
    switch (c) {
        case ' ': case '\t': case '\r': case '\n': case '\v': case '\f':
        case ',': case '[': case ']': case '"': case '\'':
            return true;
        default:
            return false;
    }
}

// ─── DeckLoader::strip_comments ───────────────────────────────────────────────

std::string DeckLoader::strip_comments(std::string_view content) noexcept {
    std::string body;
    body.reserve(content.size());

    std::size_t line_start = 0;
    while (line_start <= content.size()) {
        std::size_t line_end = content.find('\n', line_start);
        if (line_end == std::string_view::npos) {
            line_end = content.size();
        }
        const std::string_view line = content.substr(line_start, line_end - line_start);
        line_start = line_end + 1;

        if (is_skippable_line(line)) {
            continue;
        }
        body.append(line);
        body.push_back('\n');
    }
    return body;
}

// ─── DeckLoader::parse_json_array ─────────────────────────────────────────────

std::optional<std::vector<std::string>>
DeckLoader::parse_json_array(std::string_view body) noexcept {
    const auto doc = nlohmann::json::parse(body.begin(), body.end(),
                                           /*cb=*/nullptr,
                                           /*allow_exceptions=*/false);
    if (!doc.is_array()) {
        return std::nullopt;
    }

    std::vector<std::string> tokens;
    tokens.reserve(doc.size());
    for (const auto& item : doc) {
        // Non-string elements are kept verbatim so validation can name them.
        tokens.push_back(item.is_string() ? item.get<std::string>() : item.dump());
    }
    return tokens;
}

// ─── DeckLoader::tokenise ─────────────────────────────────────────────────────

std::vector<std::string> DeckLoader::tokenise(std::string_view body) noexcept {
    std::vector<std::string> tokens;
    tokens.reserve(52);

    std::size_t i = 0;
    while (i < body.size()) {
        while (i < body.size() && is_separator(body[i])) ++i;
        const std::size_t begin = i;
        while (i < body.size() && !is_separator(body[i])) ++i;
        if (i > begin) {
            tokens.emplace_back(body.substr(begin, i - begin));
        }
    }
    return tokens;
}

// ─── DeckLoader::parse_string ─────────────────────────────────────────────────

std::vector<std::string> DeckLoader::parse_string(std::string_view content) noexcept {
    const std::string body = strip_comments(content);

    const auto first = body.find_first_not_of(" \t\r\n");
    if (first != std::string::npos && body[first] == '[') {
        if (auto tokens = parse_json_array(body)) {
            return std::move(*tokens);
        }
    }
    return tokenise(body);
}

// ─── DeckLoader::load_file ────────────────────────────────────────────────────

std::optional<std::vector<std::string>>
DeckLoader::load_file(const std::string& filepath) noexcept {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_string(contents.str());
}

} // namespace shuffled::core
