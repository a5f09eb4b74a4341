#pragma once

/// @file include/shuffled/deck_loader.hpp
/// @brief Deck description loader for the CLI and tests.
///
/// # Module: DeckLoader
///
/// ## Responsibility
/// Split a deck description into card tokens. Accepted layouts:
/// ```
/// A♠ 2♠ 3♠ ...                 whitespace separated
/// A♠,2♠,3♠,...                 comma separated
/// ["A♠","2♠","3♠",...]         JSON array of strings
/// ```
/// Lines whose first non-blank character is `#` are comments. Input that
/// starts with `[` is parsed as JSON (escapes decoded); if it is not a valid
/// JSON array it falls back to the plain tokeniser. Non-string array elements
/// are kept as their JSON text.
///
/// ## Guarantees
/// - Never validates cards; that is `parse_deck`'s job
/// - Never throws; `load_file` returns nullopt if the file cannot be opened

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace shuffled::core {

class DeckLoader {
public:
    /// Tokenise a deck description held in memory.
    [[nodiscard]] static std::vector<std::string>
    parse_string(std::string_view content) noexcept;

    /// Read and tokenise a file. nullopt if it cannot be opened.
    [[nodiscard]] static std::optional<std::vector<std::string>>
    load_file(const std::string& filepath) noexcept;

private:
    /// Separator characters between plain-text tokens.
    [[nodiscard]] static bool is_separator(char c) noexcept;

    /// The content with blank and `#` comment lines removed.
    [[nodiscard]] static std::string strip_comments(std::string_view content) noexcept;

    /// Elements of a JSON array, or nullopt if `body` is not one.
    [[nodiscard]] static std::optional<std::vector<std::string>>
    parse_json_array(std::string_view body) noexcept;

    /// Split plain text on separator characters.
    [[nodiscard]] static std::vector<std::string> tokenise(std::string_view body) noexcept;
};

} // namespace shuffled::core
