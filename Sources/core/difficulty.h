#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "log_item.h"

namespace sudoku_rounds {

enum class Difficulty : uint8_t {
    Unknown = 0,
    Simple,
    Easy,
    Medium,
    Expert
};

inline constexpr const char* difficulty_name(Difficulty d) {
    switch (d) {
        case Difficulty::Unknown: return "Unknown";
        case Difficulty::Simple: return "Simple";
        case Difficulty::Easy: return "Easy";
        case Difficulty::Medium: return "Medium";
        case Difficulty::Expert: return "Expert";
    }
    return "Unknown";
}

// Rank of the hardest technique behind one step; 0 for givens and rollbacks.
inline constexpr int technique_rank(LogType t) {
    switch (t) {
        case LogType::Given:
        case LogType::Rollback:
            return 0;
        case LogType::Single:
            return 1;
        case LogType::HiddenSingleRow:
        case LogType::HiddenSingleColumn:
        case LogType::HiddenSingleSection:
            return 2;
        case LogType::NakedPairRow:
        case LogType::NakedPairColumn:
        case LogType::NakedPairSection:
            return 3;
        case LogType::HiddenPairRow:
        case LogType::HiddenPairColumn:
        case LogType::HiddenPairSection:
            return 4;
        case LogType::PointingPairTripleRow:
        case LogType::PointingPairTripleColumn:
            return 5;
        case LogType::RowBox:
        case LogType::ColumnBox:
            return 6;
        case LogType::Guess:
            return 7;
    }
    return 0;
}

inline constexpr Difficulty difficulty_for_rank(int rank) {
    if (rank >= 7) return Difficulty::Expert;
    if (rank >= 3) return Difficulty::Medium;
    if (rank == 2) return Difficulty::Easy;
    if (rank == 1) return Difficulty::Simple;
    return Difficulty::Unknown;
}

// Scans the surviving instructions for the hardest technique used.
inline Difficulty classify_difficulty(const std::vector<LogItem>& instructions) {
    int hardest = 0;
    for (const LogItem& item : instructions) {
        const int rank = technique_rank(item.type);
        if (rank > hardest) hardest = rank;
    }
    return difficulty_for_rank(hardest);
}

} // namespace sudoku_rounds
