// ============================================================================
// SUDOKU ROUNDS - CORE
// Module: log_item.h
// Description: One step of the solve trail. Every technique, guess, given and
//              rollback produces exactly one LogItem tagged with its round.
// ============================================================================

#pragma once

#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "board.h"

namespace sudoku_rounds {

enum class LogType : uint8_t {
    Given = 0,
    Single,
    HiddenSingleRow,
    HiddenSingleColumn,
    HiddenSingleSection,
    Guess,
    Rollback,
    NakedPairRow,
    NakedPairColumn,
    NakedPairSection,
    PointingPairTripleRow,
    PointingPairTripleColumn,
    RowBox,
    ColumnBox,
    HiddenPairRow,
    HiddenPairColumn,
    HiddenPairSection
};

inline constexpr const char* log_type_description(LogType t) {
    switch (t) {
        case LogType::Given: return "Mark given";
        case LogType::Single: return "Mark only possibility for cell";
        case LogType::HiddenSingleRow: return "Mark single possibility for value in row";
        case LogType::HiddenSingleColumn: return "Mark single possibility for value in column";
        case LogType::HiddenSingleSection: return "Mark single possibility for value in section";
        case LogType::Guess: return "Mark guess (start round)";
        case LogType::Rollback: return "Roll back round";
        case LogType::NakedPairRow: return "Remove possibilities for naked pair in row";
        case LogType::NakedPairColumn: return "Remove possibilities for naked pair in column";
        case LogType::NakedPairSection: return "Remove possibilities for naked pair in section";
        case LogType::PointingPairTripleRow: return "Remove possibilities for row because all values are in one section";
        case LogType::PointingPairTripleColumn: return "Remove possibilities for column because all values are in one section";
        case LogType::RowBox: return "Remove possibilities for section because all values are in one row";
        case LogType::ColumnBox: return "Remove possibilities for section because all values are in one column";
        case LogType::HiddenPairRow: return "Remove possibilities from hidden pair in row";
        case LogType::HiddenPairColumn: return "Remove possibilities from hidden pair in column";
        case LogType::HiddenPairSection: return "Remove possibilities from hidden pair in section";
    }
    return "Unknown";
}

struct LogItem {
    Round round = 0;
    LogType type = LogType::Given;
    // 1-9, or 0 when the step does not concern a single value.
    int value = 0;
    std::optional<int> position;

    bool operator==(const LogItem&) const = default;

    // 1-indexed for display.
    std::optional<int> row() const {
        if (!position) return std::nullopt;
        return cell_to_row(*position) + 1;
    }

    std::optional<int> column() const {
        if (!position) return std::nullopt;
        return cell_to_column(*position) + 1;
    }

    std::string description() const {
        std::ostringstream out;
        out << "Round: " << static_cast<int>(round) << " - " << log_type_description(type);
        if (value > 0 || position) {
            out << " (";
            if (position) {
                out << "Row: " << *row() << " - Column: " << *column();
            }
            if (value > 0) {
                if (position) out << " - ";
                out << "Value: " << value;
            }
            out << ")";
        }
        return out.str();
    }
};

inline size_t count_log_type(const std::vector<LogItem>& items, LogType t) {
    size_t count = 0;
    for (const LogItem& item : items) {
        if (item.type == t) ++count;
    }
    return count;
}

} // namespace sudoku_rounds
