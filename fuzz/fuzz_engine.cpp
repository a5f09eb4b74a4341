/**
 * @file  fuzz_engine.cpp
 * @brief libFuzzer target for the full Engine pipeline (end-to-end)
 *
 * Build:
 *   cmake -DSHUFFLED_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_engine
 *
 * Run for 60 seconds:
 *   ./fuzz_engine -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. try_detect returns nullopt exactly when validate_deck reports an error.
 *   3. If a result is returned:
 *      a. at most one find per id
 *      b. every position < 52
 *      c. output sorted rarest-first
 *
 * Fuzzer strategy:
 *   The first byte picks a mode.
 *     • mode 0: the rest is a deck description, tokenised by DeckLoader.
 *     • mode 1: the rest is a sequence of swaps applied to the factory deck,
 *       so most inputs are valid permutations and reach the detectors.
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "shuffled/constants.hpp"
#include "shuffled/deck_loader.hpp"
#include "shuffled/engine.hpp"
#include "shuffled/factory.hpp"
#include "shuffled/rarity.hpp"

using namespace shuffled;
using namespace shuffled::core;

namespace {

std::vector<std::string> deck_from_swaps(const uint8_t* data, size_t size) {
    auto deck = factory::factory_deck();
    for (size_t i = 0; i + 1 < size; i += 2) {
        std::swap(deck[data[i] % constants::DECK_SIZE],
                  deck[data[i + 1] % constants::DECK_SIZE]);
    }
    return deck;
}

} // anonymous namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size == 0) {
        return 0;
    }

    std::vector<std::string> tokens;
    if (data[0] % 2 == 0) {
        tokens = DeckLoader::parse_string(std::string_view{
            reinterpret_cast<const char*>(data + 1), size - 1});
    } else {
        tokens = deck_from_swaps(data + 1, size - 1);
    }

    const Engine engine;
    const auto result = engine.try_detect(tokens);

    // Invariant 2: validation and try_detect agree
    assert(result.has_value() == !validate_deck(tokens).has_value());

    if (result.has_value()) {
        std::set<std::string> ids;
        for (std::size_t i = 0; i < result->size(); ++i) {
            const auto& f = (*result)[i].find;

            // Invariant 3a: one per id
            assert(ids.insert(f.id).second);

            // Invariant 3b: positions in range
            assert(!f.positions.empty());
            for (const auto p : f.positions) {
                assert(p < constants::DECK_SIZE);
            }

            // Invariant 3c: rarest first
            if (i > 0) {
                assert(tier_order((*result)[i - 1].find.tier) <= tier_order(f.tier));
            }
        }
    }

    return 0;
}
