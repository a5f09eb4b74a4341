/**
 * @file  bench/bench_detect.cpp
 * @brief Google Benchmark suite for the finds engine.
 *
 * Module:  bench/
 *
 * Benchmarks
 * ----------
 *   BM_ParseDeck            token validation + parsing only
 *   BM_CollectCandidates    all 16 detectors, no reconciliation
 *   BM_Reconcile            reconciliation of a fixed candidate list
 *   BM_Detect_Shuffled      full pipeline over a pool of random decks
 *   BM_Detect_Factory       full pipeline over the factory deck (most finds)
 *
 * Build (CMake):
 *   cmake -DSHUFFLED_BUILD_BENCH=ON ..
 *   cmake --build build --target bench_detect
 *   ./build/bench_detect --benchmark_format=json
 *
 * Throughput units: items/second (decks processed).
 */

#include "benchmark/benchmark.h"

#include "shuffled/card.hpp"
#include "shuffled/engine.hpp"
#include "shuffled/factory.hpp"
#include "shuffled/reconciler.hpp"

#include <algorithm>
#include <cstddef>
#include <random>
#include <string>
#include <vector>

using namespace shuffled;
using namespace shuffled::core;

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// N shuffled decks from a fixed seed, so every run measures the same work.
static std::vector<std::vector<std::string>> make_decks(std::size_t n) {
    std::mt19937 rng(20240611u);
    std::vector<std::vector<std::string>> decks(n, standard_deck());
    for (auto& deck : decks) {
        std::shuffle(deck.begin(), deck.end(), rng);
    }
    return decks;
}

// ── Pipeline stages ────────────────────────────────────────────────────────────

static void BM_ParseDeck(benchmark::State& state) {
    const auto decks = make_decks(64);
    std::size_t i = 0;
    for (auto _ : state) {
        auto deck = parse_deck(decks[i++ % decks.size()]);
        benchmark::DoNotOptimize(deck.data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_ParseDeck)->Unit(benchmark::kMicrosecond);

static void BM_CollectCandidates(benchmark::State& state) {
    const auto decks = make_decks(64);
    std::vector<Deck> parsed;
    for (const auto& d : decks) parsed.push_back(parse_deck(d));

    std::size_t i = 0;
    for (auto _ : state) {
        auto candidates = Engine::collect_candidates(parsed[i++ % parsed.size()]);
        benchmark::DoNotOptimize(candidates.data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_CollectCandidates)->Unit(benchmark::kMicrosecond);

static void BM_Reconcile(benchmark::State& state) {
    const auto candidates = Engine::collect_candidates(parse_deck(factory::factory_deck()));
    for (auto _ : state) {
        auto finds = reconcile::Reconciler::reconcile(candidates);
        benchmark::DoNotOptimize(finds.data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Reconcile)->Unit(benchmark::kMicrosecond);

// ── End to end ─────────────────────────────────────────────────────────────────

static void BM_Detect_Shuffled(benchmark::State& state) {
    const auto decks = make_decks(static_cast<std::size_t>(state.range(0)));
    const Engine engine;
    std::size_t i = 0;
    for (auto _ : state) {
        auto finds = engine.detect(decks[i++ % decks.size()]);
        benchmark::DoNotOptimize(finds.data());
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Detect_Shuffled)->Arg(1)->Arg(64)->Arg(1024)->Unit(benchmark::kMicrosecond);

static void BM_Detect_Factory(benchmark::State& state) {
    const auto deck = factory::factory_deck();
    const Engine engine;
    for (auto _ : state) {
        auto finds = engine.detect(deck);
        benchmark::DoNotOptimize(finds.data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Detect_Factory)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
