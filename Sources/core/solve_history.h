// ============================================================================
// SUDOKU ROUNDS - CORE
// Module: solve_history.h
// Description: Append-only solve trail. `history` keeps every step including
//              abandoned branches, `instructions` only the surviving ones.
// ============================================================================

#pragma once

#include <vector>

#include "log_item.h"
#include "../utils/logging.h"

namespace sudoku_rounds {

class SolveHistory {
public:
    void set_record(bool record) { record_ = record; }
    bool record() const { return record_; }

    void set_live_log(bool live) { live_log_ = live; }
    bool live_log() const { return live_log_; }

    // Callers skip building LogItems entirely when this is false.
    bool enabled() const { return record_ || live_log_; }

    void add(const LogItem& item) {
        if (live_log_) {
            log_info("history", item.description());
        }
        if (record_) {
            history_.push_back(item);
            instructions_.push_back(item);
        }
    }

    void clear() {
        history_.clear();
        instructions_.clear();
    }

    // Entries of one round are always contiguous and trailing while that
    // round is the deepest one outstanding.
    void truncate_round(Round round) {
        while (!instructions_.empty() && instructions_.back().round == round) {
            instructions_.pop_back();
        }
    }

    const std::vector<LogItem>& history() const { return history_; }
    const std::vector<LogItem>& instructions() const { return instructions_; }

    bool operator==(const SolveHistory&) const = default;

private:
    bool record_ = false;
    bool live_log_ = false;
    std::vector<LogItem> history_;
    std::vector<LogItem> instructions_;
};

} // namespace sudoku_rounds
