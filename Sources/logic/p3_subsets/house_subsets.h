// ============================================================================
// SUDOKU ROUNDS - LOGIC ENGINE
// Module: house_subsets.h (Level 3)
// Description: Naked pairs (two cells of a house sharing the same two values)
//              and hidden pairs (two values confined to the same two cells of
//              a house). Both only eliminate possibilities.
// ============================================================================

#pragma once

#include <array>

#include "../../core/geometry.h"
#include "../../core/log_item.h"
#include "../../core/solve_state.h"
#include "../logic_result.h"

namespace sudoku_rounds::logic::p3_subsets {

// Strikes from `target` every value that `source` still allows.
inline bool remove_possibilities_in_one_from_two(SolveState& st, int source, int target, Round round) {
    bool done_something = false;
    for (int vi = 0; vi < kRowColSecSize; ++vi) {
        if (st.board.is_possible(vi, source) && st.board.eliminate(vi, target, round)) {
            done_something = true;
        }
    }
    return done_something;
}

inline constexpr LogType naked_pair_log_type(HouseKind kind) {
    switch (kind) {
        case HouseKind::Row: return LogType::NakedPairRow;
        case HouseKind::Column: return LogType::NakedPairColumn;
        case HouseKind::Section: return LogType::NakedPairSection;
    }
    return LogType::NakedPairRow;
}

inline constexpr LogType hidden_pair_log_type(HouseKind kind) {
    switch (kind) {
        case HouseKind::Row: return LogType::HiddenPairRow;
        case HouseKind::Column: return LogType::HiddenPairColumn;
        case HouseKind::Section: return LogType::HiddenPairSection;
    }
    return LogType::HiddenPairRow;
}

inline ApplyResult apply_naked_pair(SolveState& st, Round round) {
    static constexpr std::array<HouseKind, 3> kKinds = {HouseKind::Row, HouseKind::Column, HouseKind::Section};

    for (int first = 0; first < kBoardSize; ++first) {
        if (st.board.count_possibilities(first) != 2) continue;

        for (int second = first + 1; second < kBoardSize; ++second) {
            if (st.board.count_possibilities(second) != 2) continue;
            if (!st.board.are_possibilities_same(first, second)) continue;

            for (const HouseKind kind : kKinds) {
                const int house = house_of_cell(kind, first);
                if (house != house_of_cell(kind, second)) continue;

                bool done_something = false;
                for (int offset = 0; offset < kRowColSecSize; ++offset) {
                    const int target = house_cell(kind, house, offset);
                    if (target == first || target == second) continue;
                    if (remove_possibilities_in_one_from_two(st, first, target, round)) {
                        done_something = true;
                    }
                }
                if (done_something) {
                    if (st.history.enabled()) {
                        st.history.add(LogItem{round, naked_pair_log_type(kind), 0, first});
                    }
                    return ApplyResult::Progress;
                }
            }
        }
    }
    return ApplyResult::NoProgress;
}

inline ApplyResult apply_hidden_pair(SolveState& st, Round round, HouseKind kind) {
    for (int house = 0; house < kRowColSecSize; ++house) {
        for (int vi = 0; vi < kRowColSecSize; ++vi) {
            int count = 0;
            int offset1 = -1;
            int offset2 = -1;
            for (int offset = 0; offset < kRowColSecSize; ++offset) {
                if (!st.board.is_possible(vi, house_cell(kind, house, offset))) continue;
                if (offset1 < 0) {
                    offset1 = offset;
                } else {
                    offset2 = offset;
                }
                ++count;
            }
            if (count != 2) continue;

            for (int vi2 = vi + 1; vi2 < kRowColSecSize; ++vi2) {
                int count2 = 0;
                int offset3 = -1;
                int offset4 = -1;
                for (int offset = 0; offset < kRowColSecSize; ++offset) {
                    if (!st.board.is_possible(vi2, house_cell(kind, house, offset))) continue;
                    if (offset3 < 0) {
                        offset3 = offset;
                    } else {
                        offset4 = offset;
                    }
                    ++count2;
                }
                if (count2 != 2 || offset1 != offset3 || offset2 != offset4) continue;

                const int cell1 = house_cell(kind, house, offset1);
                const int cell2 = house_cell(kind, house, offset2);
                bool done_something = false;
                for (int vi3 = 0; vi3 < kRowColSecSize; ++vi3) {
                    if (vi3 == vi || vi3 == vi2) continue;
                    if (st.board.eliminate(vi3, cell1, round)) done_something = true;
                    if (st.board.eliminate(vi3, cell2, round)) done_something = true;
                }
                if (done_something) {
                    if (st.history.enabled()) {
                        st.history.add(LogItem{round, hidden_pair_log_type(kind), vi + 1, cell1});
                    }
                    return ApplyResult::Progress;
                }
            }
        }
    }
    return ApplyResult::NoProgress;
}

} // namespace sudoku_rounds::logic::p3_subsets
