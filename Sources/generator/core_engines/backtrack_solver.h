// ============================================================================
// SUDOKU ROUNDS - CORE ENGINES
// Module: backtrack_solver.h
// Description: Propagate-then-guess recursion. Propagation runs at an even
//              round, the guess that follows it at round + 1 and the nested
//              propagation at round + 2, so a failed branch is undone by
//              rolling back exactly those two rounds.
// ============================================================================

#pragma once

#include "../../core/board.h"
#include "../../core/solve_state.h"
#include "../../logic/sudoku_logic_engine.h"

namespace sudoku_rounds::core_engines {

inline bool solve_round(SolveState& st, Round round) {
    st.last_solve_round = round;

    if (st.board.is_solved()) return true;
    if (st.board.is_impossible()) return false;

    while (logic::single_solve_move(st, round)) {
        if (st.board.is_solved()) return true;
        if (st.board.is_impossible()) return false;
    }

    const Round guess_round = static_cast<Round>(round + 1);
    const Round next_round = static_cast<Round>(round + 2);
    for (int guess_number = 0; st.guess(guess_round, guess_number); ++guess_number) {
        if (!st.board.is_impossible() && solve_round(st, next_round)) {
            return true;
        }
        st.rollback_round(next_round);
        st.rollback_round(guess_round);
    }
    return false;
}

// Full solve of the current puzzle with freshly shuffled orders.
inline bool solve_puzzle(SolveState& st) {
    if (!st.reset()) {
        return false;
    }
    st.shuffle_random_arrays();
    return solve_round(st, kFirstSolveRound);
}

} // namespace sudoku_rounds::core_engines
