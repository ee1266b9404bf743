// ============================================================================
// SUDOKU ROUNDS - LOGIC ENGINE
// Module: sudoku_logic_engine.h
// Description: Central propagation dispatcher. Tries the techniques from the
//              cheapest to the most involved and stops at the first one that
//              changes the board, so every call is one logged step.
// ============================================================================
//Author copyright Marcin Matysek (Rewertyn)

#pragma once

#include <cstddef>
#include <cstdint>

#include "../core/geometry.h"
#include "../core/solve_state.h"
#include "logic_result.h"

#include "p1_easy/naked_hidden_single.h"
#include "p2_intersections/intersections.h"
#include "p3_subsets/house_subsets.h"

namespace sudoku_rounds::logic {

namespace detail {

template <typename Fn>
inline bool run_slot(SolveState& st, StrategySlot slot, Fn&& fn) {
    StrategyStats& s = st.propagator_stats.slots[static_cast<size_t>(slot)];
    const uint64_t t0 = now_ns();
    ++s.use_count;
    const ApplyResult ar = fn();
    s.elapsed_ns += now_ns() - t0;
    if (ar != ApplyResult::Progress) {
        return false;
    }
    ++s.hit_count;
    return true;
}

} // namespace detail

// One propagation step at `round`. False when no technique applies.
inline bool single_solve_move(SolveState& st, Round round) {
    using detail::run_slot;

    // ====================================================================
    // LEVEL 1: SINGLES
    // ====================================================================
    if (run_slot(st, SlotSingle, [&] { return p1_easy::apply_single(st, round); })) return true;
    if (run_slot(st, SlotHiddenSingleSection, [&] { return p1_easy::apply_hidden_single(st, round, HouseKind::Section); })) return true;
    if (run_slot(st, SlotHiddenSingleRow, [&] { return p1_easy::apply_hidden_single(st, round, HouseKind::Row); })) return true;
    if (run_slot(st, SlotHiddenSingleColumn, [&] { return p1_easy::apply_hidden_single(st, round, HouseKind::Column); })) return true;

    // ====================================================================
    // LEVEL 2: PAIRS AND LOCKED CANDIDATES
    // ====================================================================
    if (run_slot(st, SlotNakedPair, [&] { return p3_subsets::apply_naked_pair(st, round); })) return true;
    if (run_slot(st, SlotPointingRow, [&] { return p2_intersections::apply_pointing(st, round, HouseKind::Row); })) return true;
    if (run_slot(st, SlotPointingColumn, [&] { return p2_intersections::apply_pointing(st, round, HouseKind::Column); })) return true;
    if (run_slot(st, SlotRowBox, [&] { return p2_intersections::apply_box_line(st, round, HouseKind::Row); })) return true;
    if (run_slot(st, SlotColumnBox, [&] { return p2_intersections::apply_box_line(st, round, HouseKind::Column); })) return true;
    if (run_slot(st, SlotHiddenPairRow, [&] { return p3_subsets::apply_hidden_pair(st, round, HouseKind::Row); })) return true;
    if (run_slot(st, SlotHiddenPairColumn, [&] { return p3_subsets::apply_hidden_pair(st, round, HouseKind::Column); })) return true;
    if (run_slot(st, SlotHiddenPairSection, [&] { return p3_subsets::apply_hidden_pair(st, round, HouseKind::Section); })) return true;

    return false;
}

} // namespace sudoku_rounds::logic
