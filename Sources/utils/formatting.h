#pragma once

#include <cstddef>
#include <sstream>
#include <string>
#include <vector>

#include "../config/run_config.h"
#include "../core/difficulty.h"
#include "../core/geometry.h"
#include "../core/log_item.h"
#include "../sudoku_session.h"

namespace sudoku_rounds {

inline constexpr const char* kSectionRule = "-------|-------|-------";

// Grid text in the requested style. Blanks print as '.'. CSV ends in a comma
// so several fields can follow on the same line.
inline std::string puzzle_to_string(const Grid& grid, PrintStyle style) {
    const bool readable = style == PrintStyle::Readable;
    const bool multiline = readable || style == PrintStyle::Compact;

    std::string out;
    out.reserve(256);
    for (int i = 0; i < kBoardSize; ++i) {
        if (readable) out.push_back(' ');
        const uint8_t v = grid[static_cast<size_t>(i)];
        out.push_back(v == 0 ? '.' : static_cast<char>('0' + v));

        if (i == kBoardSize - 1) {
            out.push_back(style == PrintStyle::Csv ? ',' : '\n');
            if (multiline) out.push_back('\n');
        } else if (i % kRowColSecSize == kRowColSecSize - 1) {
            if (multiline) out.push_back('\n');
            if (readable && i % kSecGroupSize == kSecGroupSize - 1) {
                out += kSectionRule;
                out.push_back('\n');
            }
        } else if (readable && i % kGridSize == kGridSize - 1) {
            out += " |";
        }
    }
    return out;
}

// Numbered listing, one item per line (" -- " separated in CSV).
inline std::string history_to_string(const std::vector<LogItem>& items, PrintStyle style, bool recorded) {
    const char* sep = style == PrintStyle::Csv ? " -- " : "\n";
    std::ostringstream out;
    if (!recorded) {
        out << "History was not recorded." << sep;
    }
    for (size_t i = 0; i < items.size(); ++i) {
        out << (i + 1) << ". " << items[i].description() << sep;
    }
    out << (style == PrintStyle::Csv ? "," : "\n");
    return out.str();
}

inline std::string instructions_to_string(const SudokuSession& session, PrintStyle style) {
    if (!session.is_solved()) {
        return "No solve instructions - Puzzle is not possible to solve.";
    }
    return history_to_string(session.get_solve_instructions(), style, session.record_history());
}

inline std::string stats_to_string(const SudokuSession& session, PrintStyle style) {
    std::ostringstream out;
    const char* difficulty = difficulty_name(session.get_difficulty());
    if (style == PrintStyle::Csv) {
        out << difficulty << ','
            << session.given_count() << ','
            << session.single_count() << ','
            << session.hidden_single_count() << ','
            << session.naked_pair_count() << ','
            << session.hidden_pair_count() << ','
            << session.pointing_pair_triple_count() << ','
            << session.box_line_reduction_count() << ','
            << session.guess_count() << ','
            << session.backtrack_count() << ',';
        return out.str();
    }
    out << "Difficulty: " << difficulty << '\n'
        << "Number of Givens: " << session.given_count() << '\n'
        << "Number of Singles: " << session.single_count() << '\n'
        << "Number of Hidden Singles: " << session.hidden_single_count() << '\n'
        << "Number of Naked Pairs: " << session.naked_pair_count() << '\n'
        << "Number of Hidden Pairs: " << session.hidden_pair_count() << '\n'
        << "Number of Pointing Pairs/Triples: " << session.pointing_pair_triple_count() << '\n'
        << "Number of Box/Line Intersections: " << session.box_line_reduction_count() << '\n'
        << "Number of Guesses: " << session.guess_count() << '\n'
        << "Number of Backtracks: " << session.backtrack_count() << '\n';
    return out.str();
}

// Per-technique telemetry, one line per slot.
inline std::string propagator_stats_to_string(const logic::PropagatorStats& stats) {
    std::ostringstream out;
    for (size_t slot = 0; slot < logic::kStrategySlotCount; ++slot) {
        const logic::StrategyStats& s = stats.slots[slot];
        out << logic::kStrategySlotNames[slot]
            << " use=" << s.use_count
            << " hit=" << s.hit_count
            << " ms=" << (static_cast<double>(s.elapsed_ns) / 1.0e6)
            << '\n';
    }
    return out.str();
}

// Header row matching the CSV fields printed by the CLI.
inline std::string csv_header(const RunConfig& cfg) {
    std::string out;
    if (cfg.print_puzzle) out += "Puzzle,";
    if (cfg.print_solution) out += "Solution,";
    if (cfg.print_history) out += "Solve History,";
    if (cfg.print_instructions) out += "Solve Instructions,";
    if (cfg.count_solutions) out += "Solution Count,";
    if (cfg.timer) out += "Time (milliseconds),";
    if (cfg.print_stats) {
        out += "Difficulty,Givens,Singles,Hidden Singles,Naked Pairs,Hidden Pairs,"
               "Pointing Pairs/Triples,Box/Line Intersections,Guesses,Backtracks,";
    }
    return out;
}

} // namespace sudoku_rounds
