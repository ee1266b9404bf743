// ============================================================================
// SUDOKU ROUNDS - LOGIC ENGINE
// Module: naked_hidden_single.h (Level 1)
// Description: Naked singles (one value left in a cell) and hidden singles
//              (one cell left for a value in a house). Each call places at
//              most one value.
// ============================================================================

#pragma once

#include "../../core/geometry.h"
#include "../../core/log_item.h"
#include "../../core/solve_state.h"
#include "../logic_result.h"

namespace sudoku_rounds::logic::p1_easy {

inline ApplyResult apply_single(SolveState& st, Round round) {
    for (int position = 0; position < kBoardSize; ++position) {
        if (st.board.solution[static_cast<size_t>(position)] != 0) continue;

        int count = 0;
        int last_value = 0;
        for (int vi = 0; vi < kRowColSecSize; ++vi) {
            if (st.board.is_possible(vi, position)) {
                ++count;
                last_value = vi + 1;
            }
        }
        if (count != 1) continue;

        st.board.mark(position, round, last_value);
        if (st.history.enabled()) {
            st.history.add(LogItem{round, LogType::Single, last_value, position});
        }
        return ApplyResult::Progress;
    }
    return ApplyResult::NoProgress;
}

inline constexpr LogType hidden_single_log_type(HouseKind kind) {
    switch (kind) {
        case HouseKind::Row: return LogType::HiddenSingleRow;
        case HouseKind::Column: return LogType::HiddenSingleColumn;
        case HouseKind::Section: return LogType::HiddenSingleSection;
    }
    return LogType::HiddenSingleRow;
}

inline ApplyResult apply_hidden_single(SolveState& st, Round round, HouseKind kind) {
    for (int house = 0; house < kRowColSecSize; ++house) {
        for (int vi = 0; vi < kRowColSecSize; ++vi) {
            int count = 0;
            int last_position = 0;
            for (int offset = 0; offset < kRowColSecSize; ++offset) {
                const int position = house_cell(kind, house, offset);
                if (st.board.is_possible(vi, position)) {
                    ++count;
                    last_position = position;
                }
            }
            if (count != 1) continue;

            const int value = vi + 1;
            if (st.history.enabled()) {
                st.history.add(LogItem{round, hidden_single_log_type(kind), value, last_position});
            }
            st.board.mark(last_position, round, value);
            return ApplyResult::Progress;
        }
    }
    return ApplyResult::NoProgress;
}

} // namespace sudoku_rounds::logic::p1_easy
