// ============================================================================
// SUDOKU ROUNDS - SESSION
// Module: sudoku_session.h
// Description: Public entry point. One session owns one puzzle, its solve
//              state and its random source; every query below runs on that
//              state and nothing is shared between sessions.
// ============================================================================
//Author copyright Marcin Matysek (Rewertyn)

#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <vector>

#include "config/run_config.h"
#include "core/board.h"
#include "core/difficulty.h"
#include "core/geometry.h"
#include "core/log_item.h"
#include "core/solve_state.h"
#include "generator/core_engines/backtrack_solver.h"
#include "generator/core_engines/solution_counter.h"
#include "generator/generator_facade.h"
#include "logic/logic_result.h"
#include "utils/logging.h"

namespace sudoku_rounds {

class SudokuSession {
public:
    SudokuSession() = default;
    explicit SudokuSession(uint64_t seed) : st_(seed) {}

    void reseed(uint64_t seed) { st_.random.reseed(seed); }
    uint64_t seed() const { return st_.random.seed(); }

    // False if the givens contradict each other or a value is above 9. The
    // puzzle is stored either way.
    bool set_puzzle(const Grid& puzzle) {
        st_.board.puzzle = puzzle;
        const bool ok = st_.reset();
        if (!ok) {
            log_warn("session", "set_puzzle: givens contradict each other");
        }
        return ok;
    }

    bool generate_puzzle() { return generate_puzzle_with_symmetry(Symmetry::None); }

    bool generate_puzzle_with_symmetry(Symmetry symmetry) {
        return generator::generate_puzzle_symmetry(st_, symmetry);
    }

    bool solve() {
        const bool solved = core_engines::solve_puzzle(st_);
        log_debug("session", std::string("solve ") + (solved ? "succeeded" : "failed") +
                                 " last_round=" + std::to_string(static_cast<int>(st_.last_solve_round)));
        return solved;
    }

    bool has_no_solution() { return count_solutions_limited() == 0; }
    bool has_unique_solution() { return count_solutions_limited() == 1; }
    bool has_multiple_solutions() { return count_solutions_limited() > 1; }

    int count_total_solutions() { return core_engines::count_solutions(st_, false); }

    // Stops at two; enough to tell none, one and many apart.
    int count_solutions_limited() { return core_engines::count_solutions(st_, true); }

    Difficulty get_difficulty() const { return classify_difficulty(get_solve_instructions()); }

    std::vector<LogItem> get_solve_history() const { return st_.history.history(); }

    std::vector<LogItem> get_solve_instructions() const {
        if (!is_solved()) {
            return {};
        }
        return st_.history.instructions();
    }

    void set_record_history(bool record) { st_.history.set_record(record); }
    bool record_history() const { return st_.history.record(); }

    void set_log_history(bool live) { st_.history.set_live_log(live); }
    bool log_history() const { return st_.history.live_log(); }

    const Grid& puzzle() const { return st_.board.puzzle; }
    const Grid& solution() const { return st_.board.solution; }
    bool is_solved() const { return st_.board.is_solved(); }
    int given_count() const { return st_.board.given_count(); }

    size_t single_count() const { return instruction_count({LogType::Single}); }
    size_t hidden_single_count() const {
        return instruction_count({LogType::HiddenSingleRow, LogType::HiddenSingleColumn, LogType::HiddenSingleSection});
    }
    size_t naked_pair_count() const {
        return instruction_count({LogType::NakedPairRow, LogType::NakedPairColumn, LogType::NakedPairSection});
    }
    size_t hidden_pair_count() const {
        return instruction_count({LogType::HiddenPairRow, LogType::HiddenPairColumn, LogType::HiddenPairSection});
    }
    size_t pointing_pair_triple_count() const {
        return instruction_count({LogType::PointingPairTripleRow, LogType::PointingPairTripleColumn});
    }
    size_t box_line_reduction_count() const { return instruction_count({LogType::RowBox, LogType::ColumnBox}); }
    size_t guess_count() const { return instruction_count({LogType::Guess}); }

    // Unlucky guesses; counted over the full history since rolled back
    // branches never survive into the instructions.
    size_t backtrack_count() const { return count_log_type(st_.history.history(), LogType::Rollback); }

    const logic::PropagatorStats& propagator_stats() const { return st_.propagator_stats; }

    const SolveState& state() const { return st_; }

private:
    size_t instruction_count(std::initializer_list<LogType> types) const {
        size_t total = 0;
        for (const LogType t : types) {
            total += count_log_type(st_.history.instructions(), t);
        }
        return total;
    }

    SolveState st_;
};

} // namespace sudoku_rounds
