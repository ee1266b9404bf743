// ============================================================================
// SUDOKU ROUNDS - LOGIC ENGINE
// Module: intersections.h (Level 2)
// Description: Locked candidates. Pointing pairs/triples push a value out of
//              the rest of a row or column when a section confines it to that
//              line; box/line reduction pushes it out of the rest of a
//              section when a line confines it to that section.
// ============================================================================

#pragma once

#include "../../core/geometry.h"
#include "../../core/log_item.h"
#include "../../core/solve_state.h"
#include "../logic_result.h"

namespace sudoku_rounds::logic::p2_intersections {

// Returns the band (0-2) holding every remaining `vi` of the section, or -1
// when there is none or the value spreads over several bands. by_row picks
// rows of the section, otherwise columns.
inline int section_band_for_value(const SolveState& st, int section, int vi, bool by_row) {
    int band = -1;
    for (int offset = 0; offset < kRowColSecSize; ++offset) {
        if (!st.board.is_possible(vi, section_to_cell(section, offset))) continue;
        const int b = by_row ? offset / kGridSize : offset % kGridSize;
        if (band < 0) {
            band = b;
        } else if (band != b) {
            return -1;
        }
    }
    return band;
}

// Same question from the line side: which third of the row (column) holds
// every remaining `vi`.
inline int line_band_for_value(const SolveState& st, HouseKind kind, int line, int vi) {
    int band = -1;
    for (int offset = 0; offset < kRowColSecSize; ++offset) {
        if (!st.board.is_possible(vi, house_cell(kind, line, offset))) continue;
        const int b = offset / kGridSize;
        if (band < 0) {
            band = b;
        } else if (band != b) {
            return -1;
        }
    }
    return band;
}

inline ApplyResult apply_pointing(SolveState& st, Round round, HouseKind line_kind) {
    const bool by_row = line_kind == HouseKind::Row;
    for (int vi = 0; vi < kRowColSecSize; ++vi) {
        for (int section = 0; section < kRowColSecSize; ++section) {
            const int band = section_band_for_value(st, section, vi, by_row);
            if (band < 0) continue;

            const int first = section_to_first_cell(section);
            const int line = by_row ? cell_to_row(first) + band : cell_to_column(first) + band;
            bool done_something = false;
            for (int offset = 0; offset < kRowColSecSize; ++offset) {
                const int position = house_cell(line_kind, line, offset);
                if (cell_to_section(position) == section) continue;
                if (st.board.eliminate(vi, position, round)) done_something = true;
            }
            if (done_something) {
                if (st.history.enabled()) {
                    const LogType type = by_row ? LogType::PointingPairTripleRow : LogType::PointingPairTripleColumn;
                    st.history.add(LogItem{round, type, vi + 1, house_cell(line_kind, line, 0)});
                }
                return ApplyResult::Progress;
            }
        }
    }
    return ApplyResult::NoProgress;
}

inline ApplyResult apply_box_line(SolveState& st, Round round, HouseKind line_kind) {
    const bool by_row = line_kind == HouseKind::Row;
    for (int vi = 0; vi < kRowColSecSize; ++vi) {
        for (int line = 0; line < kRowColSecSize; ++line) {
            const int band = line_band_for_value(st, line_kind, line, vi);
            if (band < 0) continue;

            const int section = cell_to_section(house_cell(line_kind, line, band * kGridSize));
            bool done_something = false;
            for (int offset = 0; offset < kRowColSecSize; ++offset) {
                const int position = section_to_cell(section, offset);
                if (house_of_cell(line_kind, position) == line) continue;
                if (st.board.eliminate(vi, position, round)) done_something = true;
            }
            if (done_something) {
                if (st.history.enabled()) {
                    const LogType type = by_row ? LogType::RowBox : LogType::ColumnBox;
                    st.history.add(LogItem{round, type, vi + 1, house_cell(line_kind, line, 0)});
                }
                return ApplyResult::Progress;
            }
        }
    }
    return ApplyResult::NoProgress;
}

} // namespace sudoku_rounds::logic::p2_intersections
