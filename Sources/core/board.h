#pragma once

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>

#include "geometry.h"

namespace sudoku_rounds {

// Round 0 is unused, round 1 holds the givens, rounds >= 2 belong to the search.
using Round = uint8_t;

inline constexpr Round kGivenRound = 1;
inline constexpr Round kFirstSolveRound = 2;

// Raised when mark() is asked to break the board invariants. This is a bug in
// the caller's bookkeeping, never a property of the puzzle.
class MarkError : public std::logic_error {
public:
    explicit MarkError(const std::string& what) : std::logic_error(what) {}
};

struct RoundBoard {
    // Givens 1-9, blanks 0. Untouched by solving.
    Grid puzzle{};
    // Values worked out so far, 0 where still unknown.
    Grid solution{};
    // Round at which each solution value was placed, 0 where unplaced.
    std::array<Round, kBoardSize> solution_round{};
    // 0 while (value, cell) is still possible, otherwise the round that ruled it out.
    std::array<Round, kPossibilitySize> possibilities{};

    bool operator==(const RoundBoard&) const = default;

    void clear_derived() {
        solution.fill(0);
        solution_round.fill(0);
        possibilities.fill(0);
    }

    bool is_possible(int value_index, int cell) const {
        return possibilities[static_cast<size_t>(possibility_index(value_index, cell))] == 0;
    }

    // Write-once: a slot already stamped keeps its earlier round.
    bool eliminate(int value_index, int cell, Round round) {
        Round& slot = possibilities[static_cast<size_t>(possibility_index(value_index, cell))];
        if (slot != 0) {
            return false;
        }
        slot = round;
        return true;
    }

    void mark(int position, Round round, int value) {
        if (position < 0 || position >= kBoardSize || value < 1 || value > kRowColSecSize) {
            throw MarkError("Marking outside the board: position " + std::to_string(position) +
                            " value " + std::to_string(value));
        }
        const size_t pos = static_cast<size_t>(position);
        if (solution[pos] != 0) {
            throw MarkError("Marking position that already has been marked: " + std::to_string(position));
        }
        if (solution_round[pos] != 0) {
            throw MarkError("Marking position that was marked another round: " + std::to_string(position));
        }
        const int value_index = value - 1;
        if (!is_possible(value_index, position)) {
            throw MarkError("Marking impossible position: " + std::to_string(position) +
                            " value " + std::to_string(value));
        }

        solution[pos] = static_cast<uint8_t>(value);
        solution_round[pos] = round;

        const int row = cell_to_row(position);
        const int column = cell_to_column(position);
        const int section = cell_to_section(position);
        for (int i = 0; i < kRowColSecSize; ++i) {
            eliminate(value_index, row_column_to_cell(row, i), round);
            eliminate(value_index, row_column_to_cell(i, column), round);
            eliminate(value_index, section_to_cell(section, i), round);
        }
        for (int vi = 0; vi < kRowColSecSize; ++vi) {
            eliminate(vi, position, round);
        }
    }

    void rollback(Round round) {
        for (int i = 0; i < kBoardSize; ++i) {
            const size_t pos = static_cast<size_t>(i);
            if (solution_round[pos] == round) {
                solution_round[pos] = 0;
                solution[pos] = 0;
            }
        }
        for (Round& slot : possibilities) {
            if (slot == round) {
                slot = 0;
            }
        }
    }

    bool is_solved() const {
        return std::none_of(solution.begin(), solution.end(), [](uint8_t v) { return v == 0; });
    }

    int count_possibilities(int cell) const {
        int count = 0;
        for (int vi = 0; vi < kRowColSecSize; ++vi) {
            if (is_possible(vi, cell)) ++count;
        }
        return count;
    }

    bool is_impossible() const {
        for (int position = 0; position < kBoardSize; ++position) {
            if (solution[static_cast<size_t>(position)] == 0 && count_possibilities(position) == 0) {
                return true;
            }
        }
        return false;
    }

    bool are_possibilities_same(int a, int b) const {
        for (int vi = 0; vi < kRowColSecSize; ++vi) {
            if (is_possible(vi, a) != is_possible(vi, b)) {
                return false;
            }
        }
        return true;
    }

    int given_count() const {
        return static_cast<int>(std::count_if(puzzle.begin(), puzzle.end(), [](uint8_t v) { return v != 0; }));
    }
};

} // namespace sudoku_rounds
