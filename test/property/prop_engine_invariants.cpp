/**
 * @file  prop_engine_invariants.cpp
 * @brief Property: ∀ permutation of the deck, the engine output is well formed.
 *
 * Run with 10,000 random decks:
 *   RC_PARAMS="max_success=10000" ./prop_engine_invariants
 *
 * Checked on every deck:
 *   • at most one find per id
 *   • every position is in [0, 52) and no find repeats a position
 *   • output is sorted rarest-first
 *   • a Royal Flush never shares a position with a Straight Flush, a
 *     Straight, a longer run or a suited streak
 *   • a Straight Flush never shares a position with its loser set
 */

#include "prop_support.hpp"

#include "shuffled/constants.hpp"
#include "shuffled/engine.hpp"
#include "shuffled/rarity.hpp"
#include "shuffled/reconciler.hpp"

#include <algorithm>
#include <set>
#include <string>
#include <vector>

using namespace shuffled;
using namespace shuffled::core;

int main() {
    bool ok = true;

    const Engine engine;

    // ── Property 1: one find per id, positions unique and in range ──────────
    ok = rc::check(
        "engine: one find per id with unique in-range positions",
        [&]() {
            const auto finds = engine.detect(prop::random_deck());

            std::set<std::string> seen_ids;
            for (const auto& r : finds) {
                RC_ASSERT(seen_ids.insert(r.find.id).second);
                RC_ASSERT(!r.find.positions.empty());

                std::set<std::size_t> positions(r.find.positions.begin(),
                                                r.find.positions.end());
                RC_ASSERT(positions.size() == r.find.positions.size());
                RC_ASSERT(*positions.rbegin() < constants::DECK_SIZE);
            }
        }
    ) && ok;

    // ── Property 2: rarest first ─────────────────────────────────────────────
    ok = rc::check(
        "engine: output sorted by rarity tier",
        [&]() {
            const auto finds = engine.detect(prop::random_deck());
            for (std::size_t i = 1; i < finds.size(); ++i) {
                RC_ASSERT(tier_order(finds[i - 1].find.tier) <= tier_order(finds[i].find.tier));
            }
        }
    ) && ok;

    // ── Property 3: no surviving loser overlaps a surviving winner ──────────
    ok = rc::check(
        "engine: suppression table holds on the output",
        [&]() {
            const auto finds = engine.detect(prop::random_deck());
            for (const auto& rule : reconcile::Reconciler::rules()) {
                for (const auto& w : finds) {
                    if (w.find.id != rule.winner) continue;
                    for (const auto& l : finds) {
                        const bool is_loser = std::find(rule.losers.begin(), rule.losers.end(),
                                                        l.find.id) != rule.losers.end();
                        if (!is_loser) continue;
                        RC_ASSERT(!reconcile::Reconciler::positions_overlap(
                            w.find.positions, l.find.positions));
                    }
                }
            }
        }
    ) && ok;

    // ── Property 4: a planted royal flush is always reported ────────────────
    ok = rc::check(
        "engine: planted royal flush is reported without overlapping runs",
        [&]() {
            auto deck = prop::random_deck();
            const std::vector<std::string> royal = {"10♥", "J♥", "Q♥", "K♥", "A♥"};
            std::erase_if(deck, [&](const std::string& t) {
                return t == "9♥" || std::find(royal.begin(), royal.end(), t) != royal.end();
            });
            const auto at = *rc::gen::inRange<std::size_t>(0, deck.size() + 1);
            deck.insert(deck.begin() + static_cast<std::ptrdiff_t>(at), royal.begin(), royal.end());
            // 9♥ directly in front would make it a six-card straight flush.
            deck.push_back("9♥");

            const auto finds = engine.detect(deck);
            const auto it = std::find_if(finds.begin(), finds.end(), [](const ReportedFind& r) {
                return r.find.id == find_ids::ROYAL_FLUSH;
            });
            RC_ASSERT(it != finds.end());
            RC_ASSERT(it->find.positions.front() == at);
            RC_ASSERT(finds.front().find.tier == RarityTier::Legendary);

            for (const auto& r : finds) {
                if (r.find.id == find_ids::STRAIGHT_FLUSH || r.find.id == find_ids::STRAIGHT
                    || r.find.id == find_ids::SUITED_5) {
                    RC_ASSERT(!reconcile::Reconciler::positions_overlap(
                        it->find.positions, r.find.positions));
                }
            }
        }
    ) && ok;

    return ok ? 0 : 1;
}
