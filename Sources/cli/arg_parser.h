#pragma once

#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>
#include <utility>

#include "../config/run_config.h"

namespace sudoku_rounds {

struct ParseArgsResult {
    RunConfig cfg;
    bool ok = true;
    std::string error;
    // Set when --puzzle/--nopuzzle was given explicitly.
    bool puzzle_flag_set = false;
};

inline bool parse_u64(const char* s, uint64_t& out) {
    if (s == nullptr || *s == '\0' || *s == '-') return false;
    char* end = nullptr;
    const unsigned long long v = std::strtoull(s, &end, 10);
    if (end == s || (end != nullptr && *end != '\0')) return false;
    out = static_cast<uint64_t>(v);
    return true;
}

inline std::string usage_text() {
    return
        "sudoku_rounds <options>\n"
        "Sudoku solver and generator.\n"
        "  --generate <num>     Generate new puzzles (default 1)\n"
        "  --solve              Solve all the puzzles from standard input\n"
        "  --difficulty <diff>  Generate only simple, easy, medium or expert puzzles (default any)\n"
        "  --symmetry <sym>     none, rotate90, rotate180, mirror, flip or random (default none)\n"
        "  --puzzle             Print the puzzle (default when generating)\n"
        "  --nopuzzle           Do not print the puzzle (default when solving)\n"
        "  --solution           Print the solution\n"
        "  --history            Print the complete history of the solve\n"
        "  --instructions       Print the steps (at least one per cell) to solve the puzzle\n"
        "  --log-history        Write each step to the log file as it happens\n"
        "  --stats              Print statistics about the moves used to solve the puzzle\n"
        "  --propagator-stats   Print per-technique counters for the whole run\n"
        "  --count-solutions    Count the number of solutions to each puzzle\n"
        "  --timer              Print time to generate or solve each puzzle\n"
        "  --one-line           Print each puzzle on one line\n"
        "  --compact            Print puzzles on 9 lines\n"
        "  --readable           Print puzzles in human readable form (default)\n"
        "  --csv                Output a CSV row per puzzle\n"
        "  --seed <u64>         Seed the random source for reproducible runs\n"
        "  --log-file <path>    Log file path (default sudoku_rounds_<timestamp>.log)\n"
        "  --log-level <lvl>    debug, info, warn or error (default info)\n"
        "  --help               Print this message\n"
        "  --version            Print the version number\n";
}

inline ParseArgsResult parse_args(int argc, char** argv) {
    ParseArgsResult r{};
    r.cfg.log_level = log_level_from_env(r.cfg.log_level);

    auto fail = [&](std::string msg) {
        if (r.ok) {
            r.ok = false;
            r.error = std::move(msg);
        }
    };

    for (int i = 1; i < argc; ++i) {
        const std::string_view a(argv[i] != nullptr ? argv[i] : "");
        auto next = [&](const char*& out) -> bool {
            if (i + 1 >= argc) return false;
            out = argv[++i];
            return out != nullptr;
        };

        const char* v = nullptr;
        if (a == "--generate") {
            r.cfg.action = RunAction::Generate;
            if (i + 1 < argc && argv[i + 1] != nullptr && argv[i + 1][0] != '-') {
                if (!parse_u64(argv[++i], r.cfg.generate_count) || r.cfg.generate_count == 0) {
                    fail(std::string("Bad number of puzzles to generate: ") + argv[i]);
                }
            }
            continue;
        }
        if (a == "--solve") { r.cfg.action = RunAction::Solve; continue; }
        if (a == "--difficulty") {
            if (!next(v) || !parse_difficulty(v, r.cfg.difficulty)) {
                fail("Difficulty expected to be simple, easy, medium, expert or any");
            }
            continue;
        }
        if (a == "--symmetry") {
            if (!next(v) || !parse_symmetry(v, r.cfg.symmetry)) {
                fail("Symmetry expected to be none, rotate90, rotate180, mirror, flip or random");
            }
            continue;
        }
        if (a == "--puzzle") { r.cfg.print_puzzle = true; r.puzzle_flag_set = true; continue; }
        if (a == "--nopuzzle") { r.cfg.print_puzzle = false; r.puzzle_flag_set = true; continue; }
        if (a == "--solution") { r.cfg.print_solution = true; continue; }
        if (a == "--history") { r.cfg.print_history = true; continue; }
        if (a == "--instructions") { r.cfg.print_instructions = true; continue; }
        if (a == "--log-history") { r.cfg.log_history = true; continue; }
        if (a == "--stats") { r.cfg.print_stats = true; continue; }
        if (a == "--propagator-stats") { r.cfg.print_propagator_stats = true; continue; }
        if (a == "--count-solutions") { r.cfg.count_solutions = true; continue; }
        if (a == "--timer") { r.cfg.timer = true; continue; }
        if (a == "--one-line") { r.cfg.print_style = PrintStyle::OneLine; continue; }
        if (a == "--compact") { r.cfg.print_style = PrintStyle::Compact; continue; }
        if (a == "--readable") { r.cfg.print_style = PrintStyle::Readable; continue; }
        if (a == "--csv") { r.cfg.print_style = PrintStyle::Csv; continue; }
        if (a == "--seed") {
            if (!next(v) || !parse_u64(v, r.cfg.seed)) {
                fail("Seed expected to be an unsigned integer");
            } else {
                r.cfg.has_seed = true;
            }
            continue;
        }
        if (a == "--log-file") {
            if (!next(v) || *v == '\0') {
                fail("Log file path expected");
            } else {
                r.cfg.log_file = v;
            }
            continue;
        }
        if (a == "--log-level") {
            if (!next(v) || !parse_log_level(v, r.cfg.log_level)) {
                fail("Log level expected to be debug, info, warn or error");
            }
            continue;
        }
        if (a == "--help" || a == "-h") { r.cfg.show_help = true; continue; }
        if (a == "--version") { r.cfg.show_version = true; continue; }

        fail("Unknown argument: '" + std::string(a) + "'");
    }

    // Generated puzzles are printed unless told otherwise; solved ones are not.
    if (!r.puzzle_flag_set) {
        r.cfg.print_puzzle = r.cfg.action == RunAction::Generate;
    }
    if (r.ok && r.cfg.action != RunAction::Generate && r.cfg.difficulty != Difficulty::Unknown) {
        fail("--difficulty only applies to --generate");
    }

    return r;
}

} // namespace sudoku_rounds
