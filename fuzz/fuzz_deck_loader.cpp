/**
 * @file  fuzz_deck_loader.cpp
 * @brief libFuzzer target for DeckLoader::parse_string and parse_card
 *
 * Build:
 *   cmake -DSHUFFLED_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_deck_loader
 *
 * Safety invariants verified on every input:
 *   1. No crash for any byte sequence, including invalid UTF-8 and NUL bytes.
 *   2. Without a '[' (so no JSON array), tokens are non-empty and contain no
 *      separator characters.
 *   3. Every token that parses as a card re-serialises to itself.
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "shuffled/card.hpp"
#include "shuffled/deck_loader.hpp"

using namespace shuffled;
using namespace shuffled::core;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{
        reinterpret_cast<const char*>(data), size
    };

    const auto tokens = DeckLoader::parse_string(input);
    const bool plain_text = input.find('[') == std::string_view::npos;
    for (const auto& token : tokens) {
        // Invariant 2
        if (plain_text) {
            assert(!token.empty());
            assert(token.find_first_of(" \t\r\n,[]\"'") == std::string::npos);
        }

        // Invariant 3
        if (const auto card = parse_card(token)) {
            std::string rebuilt(to_string(card->rank));
            rebuilt += suit_symbol(card->suit);
            assert(rebuilt == token);
            assert(card->color == color_of(card->suit));
        }
    }

    // parse_card on the raw input must not crash either
    (void)parse_card(input);

    return 0;
}
