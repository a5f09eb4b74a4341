/**
 * @file  bench_runner.cpp
 * @brief Standalone micro-benchmark runner for performance regression suite.
 *
 * Usage:
 *   ./bench_runner <benchmark_name>
 *
 * Outputs a single double: nanoseconds per operation, to stdout.
 * Returns 0 on success, 1 on unknown benchmark name.
 *
 * Each benchmark runs for a wall-clock duration of at least 500ms to get
 * stable measurements, then divides total time by iteration count.
 */

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <random>
#include <string>
#include <vector>

#include "shuffled/card.hpp"
#include "shuffled/deck_loader.hpp"
#include "shuffled/engine.hpp"
#include "shuffled/factory.hpp"
#include "shuffled/reconciler.hpp"

using namespace shuffled;
using namespace std::chrono;

// ── Timing harness ────────────────────────────────────────────────────────────

template<typename Fn>
double measure_ns_per_op(Fn&& fn, long min_iters = 100) {
    // Warmup
    for (long i = 0; i < std::min(min_iters / 10L, 1000L); ++i) fn();

    // Measure until we have at least 500ms of wall time
    long iters      = 0;
    double total_ns = 0.0;

    const auto deadline = steady_clock::now() + milliseconds(500);
    do {
        const auto t0 = steady_clock::now();
        fn(); fn(); fn(); fn(); fn();  // batch 5 to reduce timer overhead
        const auto t1 = steady_clock::now();
        total_ns += static_cast<double>(duration_cast<nanoseconds>(t1 - t0).count());
        iters += 5;
    } while (steady_clock::now() < deadline || iters < min_iters);

    return total_ns / static_cast<double>(iters);
}

static std::vector<std::string> shuffled_deck(unsigned seed) {
    std::mt19937 rng(seed);
    auto deck = standard_deck();
    std::shuffle(deck.begin(), deck.end(), rng);
    return deck;
}

// ── Benchmark implementations ─────────────────────────────────────────────────

double bench_validate_deck() {
    const auto deck = shuffled_deck(1u);
    volatile bool sink = false;
    return measure_ns_per_op([&]() {
        sink = validate_deck(deck).has_value();
    }, 100'000);
}

double bench_collect_candidates() {
    const auto deck = parse_deck(shuffled_deck(2u));
    volatile std::size_t sink = 0;
    return measure_ns_per_op([&]() {
        sink = core::Engine::collect_candidates(deck).size();
    }, 100'000);
}

double bench_reconcile_factory() {
    const auto candidates = core::Engine::collect_candidates(parse_deck(factory::factory_deck()));
    volatile std::size_t sink = 0;
    return measure_ns_per_op([&]() {
        sink = reconcile::Reconciler::reconcile(candidates).size();
    }, 100'000);
}

double bench_detect_shuffled() {
    const auto deck = shuffled_deck(3u);
    const core::Engine engine;
    volatile std::size_t sink = 0;
    return measure_ns_per_op([&]() {
        sink = engine.detect(deck).size();
    }, 100'000);
}

double bench_detect_factory() {
    const auto deck = factory::factory_deck();
    const core::Engine engine;
    volatile std::size_t sink = 0;
    return measure_ns_per_op([&]() {
        sink = engine.detect(deck).size();
    }, 100'000);
}

double bench_deck_loader_parse() {
    std::string text;
    for (const auto& token : shuffled_deck(4u)) {
        text += token;
        text += ", ";
    }
    volatile std::size_t sink = 0;
    return measure_ns_per_op([&]() {
        sink = core::DeckLoader::parse_string(text).size();
    }, 100'000);
}

// ── Dispatch ──────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::fprintf(stderr, "Usage: %s <benchmark_name>\n", argv[0]);
        return 1;
    }

    const std::string name = argv[1];
    double result = -1.0;

    if (name == "validate_deck")            result = bench_validate_deck();
    else if (name == "collect_candidates")  result = bench_collect_candidates();
    else if (name == "reconcile_factory")   result = bench_reconcile_factory();
    else if (name == "detect_shuffled")     result = bench_detect_shuffled();
    else if (name == "detect_factory")      result = bench_detect_factory();
    else if (name == "deck_loader_parse")   result = bench_deck_loader_parse();
    else {
        std::fprintf(stderr, "Unknown benchmark: %s\n", name.c_str());
        return 1;
    }

    std::printf("%.2f\n", result);
    return 0;
}
