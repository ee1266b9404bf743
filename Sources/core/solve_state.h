// ============================================================================
// SUDOKU ROUNDS - CORE
// Module: solve_state.h
// Description: Everything one session mutates while solving: the round board,
//              the solve trail, the shuffled cell and value orders and the
//              propagator telemetry. Engines take it by reference.
// ============================================================================

#pragma once

#include <array>
#include <cstdint>
#include <numeric>
#include <optional>

#include "board.h"
#include "geometry.h"
#include "log_item.h"
#include "random_source.h"
#include "solve_history.h"
#include "../logic/logic_result.h"

namespace sudoku_rounds {

struct SolveState {
    RoundBoard board;
    SolveHistory history;
    RandomSource random;

    // Cell scan order for guessing, value order for guess candidates (0-8).
    std::array<int, kBoardSize> random_board_array{};
    std::array<int, kRowColSecSize> random_possibility_array{};

    // Deepest propagation round entered by the last solve_round call.
    Round last_solve_round = 0;

    logic::PropagatorStats propagator_stats;

    SolveState() { init_orders(); }
    explicit SolveState(uint64_t seed) : random(seed) { init_orders(); }

    void shuffle_random_arrays() {
        random.shuffle(random_board_array);
        random.shuffle(random_possibility_array);
    }

    // Re-derives solution, possibilities and trail from the puzzle. Givens
    // go in at round 1. False when the givens contradict each other.
    bool reset() {
        board.clear_derived();
        history.clear();
        for (int position = 0; position < kBoardSize; ++position) {
            const int value = board.puzzle[static_cast<size_t>(position)];
            if (value == 0) {
                continue;
            }
            if (value > kRowColSecSize || !board.is_possible(value - 1, position)) {
                return false;
            }
            board.mark(position, kGivenRound, value);
            if (history.enabled()) {
                history.add(LogItem{kGivenRound, LogType::Given, value, position});
            }
        }
        return true;
    }

    void rollback_round(Round round) {
        if (history.enabled()) {
            history.add(LogItem{round, LogType::Rollback, 0, std::nullopt});
        }
        board.rollback(round);
        history.truncate_round(round);
    }

    // First cell (in shuffled order) among those with the fewest options.
    int find_position_with_fewest_possibilities() const {
        int min_possibilities = kRowColSecSize + 1;
        int best = 0;
        for (const int position : random_board_array) {
            if (board.solution[static_cast<size_t>(position)] != 0) {
                continue;
            }
            const int count = board.count_possibilities(position);
            if (count < min_possibilities) {
                min_possibilities = count;
                best = position;
            }
        }
        return best;
    }

    // Marks the guess_number-th remaining value of the chosen cell at round.
    // False once the cell has no such value left.
    bool guess(Round round, int guess_number) {
        const int position = find_position_with_fewest_possibilities();
        int count = 0;
        for (const int value_index : random_possibility_array) {
            if (!board.is_possible(value_index, position)) {
                continue;
            }
            if (count == guess_number) {
                const int value = value_index + 1;
                if (history.enabled()) {
                    history.add(LogItem{round, LogType::Guess, value, position});
                }
                board.mark(position, round, value);
                return true;
            }
            ++count;
        }
        return false;
    }

private:
    void init_orders() {
        std::iota(random_board_array.begin(), random_board_array.end(), 0);
        std::iota(random_possibility_array.begin(), random_possibility_array.end(), 0);
    }
};

} // namespace sudoku_rounds
