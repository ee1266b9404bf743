// ============================================================================
// SUDOKU ROUNDS - LOGIC ENGINE
// File: logic_result.h
// Description: Result and telemetry structures for the constraint propagator.
// ============================================================================

#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace sudoku_rounds::logic {

enum class ApplyResult : uint8_t {
    NoProgress = 0,
    Progress = 1
};

// Dispatch order of single_solve_move.
enum StrategySlot : size_t {
    SlotSingle = 0,
    SlotHiddenSingleSection = 1,
    SlotHiddenSingleRow = 2,
    SlotHiddenSingleColumn = 3,
    SlotNakedPair = 4,
    SlotPointingRow = 5,
    SlotPointingColumn = 6,
    SlotRowBox = 7,
    SlotColumnBox = 8,
    SlotHiddenPairRow = 9,
    SlotHiddenPairColumn = 10,
    SlotHiddenPairSection = 11
};

inline constexpr size_t kStrategySlotCount = 12;

inline constexpr std::array<const char*, kStrategySlotCount> kStrategySlotNames = {{
    "Single",
    "HiddenSingleSection",
    "HiddenSingleRow",
    "HiddenSingleColumn",
    "NakedPair",
    "PointingRow",
    "PointingColumn",
    "RowBox",
    "ColumnBox",
    "HiddenPairRow",
    "HiddenPairColumn",
    "HiddenPairSection",
}};

struct StrategyStats {
    uint64_t use_count = 0;
    uint64_t hit_count = 0;
    uint64_t elapsed_ns = 0;
};

struct PropagatorStats {
    std::array<StrategyStats, kStrategySlotCount> slots{};

    void clear() { slots.fill(StrategyStats{}); }

    uint64_t total_hits() const {
        uint64_t total = 0;
        for (const StrategyStats& s : slots) total += s.hit_count;
        return total;
    }
};

inline uint64_t now_ns() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count());
}

} // namespace sudoku_rounds::logic
