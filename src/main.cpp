/// @file src/main.cpp
/// @brief shuffled CLI entry point.
///
/// Usage:
///   shuffled --detect <deck_file>     Detect finds in a deck file
///   shuffled --stdin                  Detect finds in a deck read from stdin
///   shuffled --factory                Detect finds in the factory-order deck
///   shuffled --compare <a> <b>        Count positions two valid decks share
///   shuffled --help                   Print usage
///
/// Flags (after the mode): --json for JSON output, --verbose for per-detector
/// candidate counts on stderr.

#include "shuffled/card.hpp"
#include "shuffled/deck_loader.hpp"
#include "shuffled/engine.hpp"
#include "shuffled/factory.hpp"
#include "shuffled/report.hpp"

#include <fmt/core.h>

#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

struct CliOptions {
    bool json    = false;
    bool verbose = false;
};

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  shuffled --detect <deck_file> [--json] [--verbose]\n"
        "  shuffled --stdin              [--json] [--verbose]\n"
        "  shuffled --factory            [--json] [--verbose]\n"
        "  shuffled --compare <a> <b>\n"
        "  shuffled --help\n"
        "\n"
        "Deck format: 52 tokens such as A♠ 10♥ Q♦, separated by spaces,\n"
        "commas or newlines, optionally as a JSON array.\n"
    );
}

/// Run the engine over `tokens` and print the finds.
/// Returns 0 on success, 1 on an invalid deck.
int run_detect(const std::vector<std::string>& tokens, const CliOptions& opts) {
    shuffled::core::Engine engine(shuffled::core::EngineConfig{.verbose = opts.verbose});

    std::vector<shuffled::ReportedFind> finds;
    try {
        finds = engine.detect(tokens);
    } catch (const shuffled::InvalidDeck& e) {
        fmt::print(stderr, "Error: invalid deck: {}\n", e.what());
        return 1;
    }

    if (opts.json) {
        fmt::print("{}\n", shuffled::report::to_json(finds));
        return 0;
    }

    fmt::print("Factory positions: {}/{}\n",
               shuffled::factory::count_factory_positions(tokens), tokens.size());
    if (finds.empty()) {
        fmt::print("No finds.\n");
    } else {
        fmt::print("{}", shuffled::report::to_text(finds));
    }
    return 0;
}

/// Load and validate one deck for --compare.
std::optional<std::vector<std::string>> load_valid_deck(const std::string& path) {
    auto tokens = shuffled::core::DeckLoader::load_file(path);
    if (!tokens) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", path);
        return std::nullopt;
    }
    if (const auto error = shuffled::validate_deck(*tokens)) {
        fmt::print(stderr, "Error: invalid deck in '{}': {}\n", path, error->message());
        return std::nullopt;
    }
    return tokens;
}

int run_compare(const std::string& path_a, const std::string& path_b) {
    const auto a = load_valid_deck(path_a);
    if (!a) {
        return 1;
    }
    const auto b = load_valid_deck(path_b);
    if (!b) {
        return 1;
    }

    const auto match = shuffled::factory::compare_decks(*a, *b);
    fmt::print("{} matching position(s) out of {}\n", match.count, a->size());
    for (const auto p : match.positions) {
        fmt::print("  {:2d}: {}\n", p, (*a)[p]);
    }
    return 0;
}

CliOptions parse_flags(int argc, char* argv[], int first) {
    CliOptions opts;
    for (int i = first; i < argc; ++i) {
        const std::string flag(argv[i]);
        if (flag == "--json") {
            opts.json = true;
        } else if (flag == "--verbose") {
            opts.verbose = true;
        } else {
            fmt::print(stderr, "Ignoring unknown flag: {}\n", flag);
        }
    }
    return opts;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string mode(argv[1]);

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    if (mode == "--detect") {
        if (argc < 3) {
            fmt::print(stderr, "Error: --detect requires a deck file path\n");
            print_usage();
            return 1;
        }
        const std::string path(argv[2]);
        const auto tokens = shuffled::core::DeckLoader::load_file(path);
        if (!tokens) {
            fmt::print(stderr, "Error: cannot open file '{}'\n", path);
            return 1;
        }
        return run_detect(*tokens, parse_flags(argc, argv, 3));
    }

    if (mode == "--stdin") {
        std::ostringstream buffer;
        buffer << std::cin.rdbuf();
        return run_detect(shuffled::core::DeckLoader::parse_string(buffer.str()),
                          parse_flags(argc, argv, 2));
    }

    if (mode == "--factory") {
        return run_detect(shuffled::factory::factory_deck(), parse_flags(argc, argv, 2));
    }

    if (mode == "--compare") {
        if (argc < 4) {
            fmt::print(stderr, "Error: --compare requires two deck file paths\n");
            print_usage();
            return 1;
        }
        return run_compare(argv[2], argv[3]);
    }

    fmt::print(stderr, "Unknown option: {}\n", mode);
    print_usage();
    return 1;
}
