// ============================================================================
// SUDOKU ROUNDS - CORE ENGINES
// Module: solution_counter.h
// Description: Exhaustive solution count with an optional stop at two, used
//              for uniqueness checks. Unlike the solver each level uses one
//              round for its guess and the propagation that follows it.
// ============================================================================

#pragma once

#include <algorithm>
#include <string>

#include "../../core/board.h"
#include "../../core/solve_state.h"
#include "../../logic/sudoku_logic_engine.h"
#include "../../utils/logging.h"

namespace sudoku_rounds::core_engines {

// Leaves the board exactly as it found it: every exit rolls back `round`.
// With `limit_to_two` the result never exceeds 2.
inline int count_solutions_round(SolveState& st, Round round, bool limit_to_two) {
    if (st.board.is_solved()) {
        st.rollback_round(round);
        return 1;
    }
    if (st.board.is_impossible()) {
        st.rollback_round(round);
        return 0;
    }

    while (logic::single_solve_move(st, round)) {
        if (st.board.is_solved()) {
            st.rollback_round(round);
            return 1;
        }
        if (st.board.is_impossible()) {
            st.rollback_round(round);
            return 0;
        }
    }

    const Round next_round = static_cast<Round>(round + 1);
    int solutions = 0;
    for (int guess_number = 0; st.guess(next_round, guess_number); ++guess_number) {
        solutions += count_solutions_round(st, next_round, limit_to_two);
        if (limit_to_two && solutions >= 2) {
            st.rollback_round(round);
            return std::min(solutions, 2);
        }
    }
    st.rollback_round(round);
    return solutions;
}

// Counts from the puzzle without disturbing the caller's solution, trail or
// history toggles.
inline int count_solutions(SolveState& st, bool limit_to_two) {
    const RoundBoard saved_board = st.board;
    const SolveHistory saved_history = st.history;

    st.history.set_record(false);
    st.history.set_live_log(false);

    int solutions = 0;
    if (st.reset()) {
        solutions = count_solutions_round(st, kFirstSolveRound, limit_to_two);
    }

    st.board = saved_board;
    st.history = saved_history;

    if (debug_logger().enabled(LogLevel::Debug)) {
        log_debug("counter", "count_solutions limit_to_two=" + std::string(limit_to_two ? "true" : "false") +
                             " result=" + std::to_string(solutions));
    }
    return solutions;
}

} // namespace sudoku_rounds::core_engines
