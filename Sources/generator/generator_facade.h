// ============================================================================
// SUDOKU ROUNDS - GENERATOR PIPELINE
// Module: generator_facade.h
// Description: Puzzle generation. Fills a random full grid with the solver,
//              then strips givens (together with their symmetric partners)
//              in shuffled order as long as the solution stays unique.
// ============================================================================
//Author copyright Marcin Matysek (Rewertyn)

#pragma once

#include <array>
#include <cstdint>
#include <string>

#include "../config/run_config.h"
#include "../core/board.h"
#include "../core/geometry.h"
#include "../core/solve_state.h"
#include "../utils/logging.h"

#include "core_engines/backtrack_solver.h"
#include "core_engines/solution_counter.h"

namespace sudoku_rounds::generator {

inline constexpr int kMaxSymmetryPartners = 3;

struct SymmetryPartners {
    std::array<int, kMaxSymmetryPartners> cells{};
    int count = 0;

    void push(int cell) { cells[static_cast<size_t>(count++)] = cell; }
};

// Images of `position` under the symmetry, the position itself excluded
// unless it maps onto itself (the centre cell).
inline SymmetryPartners symmetry_partners(int position, Symmetry symmetry) {
    constexpr int last = kRowColSecSize - 1;
    const int row = cell_to_row(position);
    const int column = cell_to_column(position);
    SymmetryPartners out;
    switch (symmetry) {
        case Symmetry::Rotate90:
            out.push(row_column_to_cell(last - column, row));
            out.push(row_column_to_cell(last - row, last - column));
            out.push(row_column_to_cell(column, last - row));
            break;
        case Symmetry::Rotate180:
            out.push(row_column_to_cell(last - row, last - column));
            break;
        case Symmetry::Mirror:
            out.push(row_column_to_cell(row, last - column));
            break;
        case Symmetry::Flip:
            out.push(row_column_to_cell(last - row, column));
            break;
        case Symmetry::None:
        case Symmetry::Random:
            break;
    }
    return out;
}

inline Symmetry resolve_symmetry(Symmetry symmetry, RandomSource& random) {
    if (symmetry != Symmetry::Random) {
        return symmetry;
    }
    static constexpr std::array<Symmetry, 4> kConcrete = {
        Symmetry::Rotate90, Symmetry::Rotate180, Symmetry::Mirror, Symmetry::Flip};
    return kConcrete[static_cast<size_t>(random.below(static_cast<int>(kConcrete.size())))];
}

// Guesses sit on odd rounds. Drops every even round below the last solve
// round so only guessed cells stay filled.
inline void rollback_non_guesses(SolveState& st) {
    for (int round = kFirstSolveRound; round < st.last_solve_round; round += 2) {
        st.rollback_round(static_cast<Round>(round));
    }
}

inline bool generate_puzzle_symmetry(SolveState& st, Symmetry symmetry) {
    symmetry = resolve_symmetry(symmetry, st.random);
    log_debug("generator", std::string("generate symmetry=") + symmetry_name(symmetry));

    const bool record = st.history.record();
    const bool live_log = st.history.live_log();
    st.history.set_record(false);
    st.history.set_live_log(false);

    st.board.puzzle.fill(0);
    st.shuffle_random_arrays();
    if (!core_engines::solve_puzzle(st)) {
        st.history.set_record(record);
        st.history.set_live_log(live_log);
        log_error("generator", "empty grid could not be filled");
        return false;
    }

    if (symmetry == Symmetry::None) {
        rollback_non_guesses(st);
    }

    st.board.puzzle = st.board.solution;
    st.shuffle_random_arrays();

    for (const int position : st.random_board_array) {
        const size_t pos = static_cast<size_t>(position);
        if (st.board.puzzle[pos] == 0) continue;

        const SymmetryPartners partners = symmetry_partners(position, symmetry);
        std::array<uint8_t, kMaxSymmetryPartners> saved_partner_values{};

        const uint8_t saved_value = st.board.puzzle[pos];
        st.board.puzzle[pos] = 0;
        for (int i = 0; i < partners.count; ++i) {
            const size_t partner = static_cast<size_t>(partners.cells[static_cast<size_t>(i)]);
            saved_partner_values[static_cast<size_t>(i)] = st.board.puzzle[partner];
            st.board.puzzle[partner] = 0;
        }

        const bool ambiguous = !st.reset() ||
                               core_engines::count_solutions_round(st, kFirstSolveRound, true) > 1;
        if (ambiguous) {
            st.board.puzzle[pos] = saved_value;
            for (int i = 0; i < partners.count; ++i) {
                const uint8_t value = saved_partner_values[static_cast<size_t>(i)];
                if (value != 0) {
                    st.board.puzzle[static_cast<size_t>(partners.cells[static_cast<size_t>(i)])] = value;
                }
            }
        }
    }

    const bool ok = st.reset();

    st.history.set_record(record);
    st.history.set_live_log(live_log);

    log_debug("generator", "generated puzzle with " + std::to_string(st.board.given_count()) + " givens");
    return ok;
}

} // namespace sudoku_rounds::generator
