#pragma once

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <istream>
#include <ostream>
#include <sstream>
#include <string>

#include "config/run_config.h"
#include "sudoku_session.h"
#include "utils/formatting.h"
#include "utils/logging.h"
#include "utils/puzzle_io.h"

namespace sudoku_rounds {

inline constexpr const char* kVersionText = "sudoku_rounds 1.0.0";

inline void apply_logging_config(const RunConfig& cfg) {
    if (!cfg.log_file.empty()) {
        debug_logger().set_path(cfg.log_file);
    }
    debug_logger().set_min_level(cfg.log_level);
}

// History is only kept when some output or filter reads it.
inline bool run_needs_history(const RunConfig& cfg) {
    return cfg.print_history || cfg.print_instructions || cfg.print_stats ||
           cfg.difficulty != Difficulty::Unknown;
}

inline bool run_needs_solve(const RunConfig& cfg) {
    return cfg.action == RunAction::Solve || cfg.print_solution || run_needs_history(cfg);
}

// One output record for the current puzzle of the session.
inline void print_puzzle_record(std::ostream& out, const RunConfig& cfg, SudokuSession& session,
                                bool solved, double elapsed_ms) {
    const PrintStyle style = cfg.print_style;
    const bool csv = style == PrintStyle::Csv;

    if (cfg.print_puzzle) {
        out << puzzle_to_string(session.puzzle(), style);
    }
    if (cfg.print_solution) {
        if (solved) {
            out << puzzle_to_string(session.solution(), style);
        } else {
            out << "Puzzle has no solution." << (csv ? "," : "\n");
        }
    }
    if (cfg.print_history) {
        out << history_to_string(session.get_solve_history(), style, session.record_history());
    }
    if (cfg.print_instructions) {
        out << instructions_to_string(session, style) << (csv ? "," : "\n");
    }
    if (cfg.count_solutions) {
        const int count = session.count_total_solutions();
        if (csv) {
            out << count << ',';
        } else {
            out << "Number of solutions: " << count << '\n';
        }
    }
    if (cfg.timer) {
        std::ostringstream t;
        t << std::fixed << std::setprecision(3) << elapsed_ms;
        if (csv) {
            out << t.str() << ',';
        } else {
            out << "Time: " << t.str() << " milliseconds\n";
        }
    }
    if (cfg.print_stats) {
        out << stats_to_string(session, style);
    }
    if (csv) {
        out << '\n';
    }
}

inline RunResult run_generate(const RunConfig& cfg, SudokuSession& session, std::ostream& out) {
    RunResult result{};
    while (result.puzzles_done < cfg.generate_count) {
        const auto t0 = std::chrono::steady_clock::now();
        ++result.attempts;
        if (!session.generate_puzzle_with_symmetry(cfg.symmetry)) {
            log_error("runner", "generation attempt " + std::to_string(result.attempts) + " failed");
            ++result.unsolvable_puzzles;
            continue;
        }

        bool solved = false;
        if (run_needs_solve(cfg)) {
            solved = session.solve();
        }
        if (cfg.difficulty != Difficulty::Unknown && session.get_difficulty() != cfg.difficulty) {
            log_debug("runner", std::string("rejected ") + difficulty_name(session.get_difficulty()) + " puzzle");
            continue;
        }

        const double elapsed_ms =
            std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();
        print_puzzle_record(out, cfg, session, solved, elapsed_ms);
        ++result.puzzles_done;
    }
    return result;
}

inline RunResult run_solve(const RunConfig& cfg, SudokuSession& session, std::istream& in, std::ostream& out) {
    RunResult result{};
    Grid puzzle{};
    while (read_puzzle(in, puzzle)) {
        ++result.attempts;
        const auto t0 = std::chrono::steady_clock::now();
        if (!session.set_puzzle(puzzle)) {
            ++result.invalid_puzzles;
            out << "Puzzle is not valid.\n";
            continue;
        }
        const bool solved = session.solve();
        if (!solved) {
            ++result.unsolvable_puzzles;
        }
        const double elapsed_ms =
            std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();
        print_puzzle_record(out, cfg, session, solved, elapsed_ms);
        ++result.puzzles_done;
    }
    return result;
}

inline RunResult run_sudoku_rounds(const RunConfig& cfg, std::istream& in, std::ostream& out) {
    apply_logging_config(cfg);
    log_info("runner", explain_run_config_text(cfg));

    SudokuSession session = cfg.has_seed ? SudokuSession(cfg.seed) : SudokuSession();
    session.set_record_history(run_needs_history(cfg));
    session.set_log_history(cfg.log_history);

    if (cfg.print_style == PrintStyle::Csv) {
        out << csv_header(cfg) << '\n';
    }

    const auto t0 = std::chrono::steady_clock::now();
    RunResult result = cfg.action == RunAction::Generate ? run_generate(cfg, session, out)
                                                         : run_solve(cfg, session, in, out);
    result.elapsed_s = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();

    if (cfg.timer && cfg.print_style != PrintStyle::Csv) {
        out << (cfg.action == RunAction::Generate ? "Generated " : "Solved ")
            << result.puzzles_done << " puzzle(s) in " << std::fixed << std::setprecision(3)
            << result.elapsed_s << " seconds.\n";
    }
    if (cfg.print_propagator_stats) {
        const std::string stats = propagator_stats_to_string(session.propagator_stats());
        if (cfg.print_style == PrintStyle::Csv) {
            log_info("runner", "propagator stats\n" + stats);
        } else {
            out << "Propagator statistics:\n" << stats;
        }
    }
    log_info("runner", "done puzzles=" + std::to_string(result.puzzles_done) +
                           " attempts=" + std::to_string(result.attempts) +
                           " invalid=" + std::to_string(result.invalid_puzzles) +
                           " unsolvable=" + std::to_string(result.unsolvable_puzzles));
    return result;
}

} // namespace sudoku_rounds
