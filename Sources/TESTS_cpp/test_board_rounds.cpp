// ============================================================================
// SUDOKU ROUNDS - BOARD AND ROUND BOOKKEEPING TESTS
// File: test_board_rounds.cpp
// Note: no include guard - this file is pulled in as a unity include
// ============================================================================

#include <initializer_list>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "../cli/arg_parser.h"
#include "../config/run_config.h"
#include "../core/board.h"
#include "../core/difficulty.h"
#include "../core/geometry.h"
#include "../core/log_item.h"
#include "../core/solve_history.h"
#include "../core/solve_state.h"
#include "../logic/sudoku_logic_engine.h"
#include "../sudoku_session.h"
#include "../utils/formatting.h"
#include "../utils/puzzle_io.h"

namespace sudoku_testy {

inline TestResult test_geometry_helpers() {
    TestResult result;
    result.name = "Geometry helpers";
    Checks c;

    c.expect(cell_to_row(80) == 8 && cell_to_column(80) == 8, "cell 80 is r8c8");
    c.expect(cell_to_section(0) == 0 && cell_to_section(40) == 4 && cell_to_section(80) == 8, "sections of 0/40/80");
    c.expect(cell_to_section(33) == 5, "cell 33 (r3c6) in section 5");
    c.expect(cell_to_section_start_cell(40) == 30, "section start of 40");
    c.expect(section_to_first_cell(5) == 33, "first cell of section 5");
    c.expect(section_to_cell(4, 4) == 40, "centre of section 4");
    c.expect(section_to_cell(8, 8) == 80, "last cell of section 8");
    c.expect(row_column_to_cell(4, 7) == 43, "r4c7");
    c.expect(possibility_index(8, 80) == kPossibilitySize - 1, "last possibility index");
    c.expect(house_cell(HouseKind::Column, 3, 2) == 21, "column 3 offset 2");
    c.expect(house_of_cell(HouseKind::Section, 21) == 1, "cell 21 in section 1");

    bool round_trip = true;
    for (int cell = 0; cell < kBoardSize; ++cell) {
        for (int k = 0; k < 3; ++k) {
            const HouseKind kind = static_cast<HouseKind>(k);
            const int house = house_of_cell(kind, cell);
            bool found = false;
            for (int offset = 0; offset < kRowColSecSize; ++offset) {
                if (house_cell(kind, house, offset) == cell) found = true;
            }
            round_trip = round_trip && found;
        }
    }
    c.expect(round_trip, "every cell found in its own houses");

    c.finish(result, "index helpers consistent");
    return result;
}

inline TestResult test_mark_stamps_peers() {
    TestResult result;
    result.name = "mark stamps row, column, section and own cell";
    Checks c;

    RoundBoard b;
    b.mark(40, 2, 5);
    c.expect(b.solution[40] == 5 && b.solution_round[40] == 2, "value and round stored");
    c.expect(!b.is_possible(4, 36), "5 gone from row 4");
    c.expect(!b.is_possible(4, 4), "5 gone from column 4");
    c.expect(!b.is_possible(4, 30), "5 gone from section 4");
    c.expect(!b.is_possible(0, 40), "other values gone from the cell");
    c.expect(b.is_possible(0, 41), "1 still open next door");
    c.expect(b.is_possible(4, 0), "5 still open far away");
    c.expect(b.possibilities[static_cast<size_t>(possibility_index(4, 36))] == 2, "stamp carries the round");

    // A later mark must not restamp slots already closed by round 2.
    b.mark(44, 3, 6);
    c.expect(b.possibilities[static_cast<size_t>(possibility_index(5, 40))] == 2, "write-once keeps round 2");
    c.expect(b.possibilities[static_cast<size_t>(possibility_index(5, 36))] == 3, "fresh slot gets round 3");

    c.finish(result, "peers stamped once");
    return result;
}

inline TestResult test_mark_errors() {
    TestResult result;
    result.name = "mark rejects broken bookkeeping";
    Checks c;

    RoundBoard b;
    b.mark(0, 2, 1);
    const RoundBoard before = b;

    auto throws = [&](int position, Round round, int value) {
        try {
            b.mark(position, round, value);
        } catch (const MarkError&) {
            return true;
        }
        return false;
    };

    c.expect(throws(0, 3, 2), "second value in a marked cell");
    c.expect(throws(1, 3, 1), "value already eliminated in row");
    c.expect(throws(81, 3, 1), "position off the board");
    c.expect(throws(5, 3, 10), "value above 9");
    c.expect(b == before, "board untouched after failed marks");

    c.finish(result, "MarkError raised before any mutation");
    return result;
}

inline TestResult test_rollback_exactness() {
    TestResult result;
    result.name = "rollback restores board and instructions exactly";
    Checks c;

    SolveState st(11);
    st.board.puzzle = grid_from(kGuessPuzzle);
    st.history.set_record(true);
    c.expect(st.reset(), "reset of a valid puzzle");
    while (logic::single_solve_move(st, 2)) {
    }
    const RoundBoard board_before = st.board;
    const std::vector<LogItem> instructions_before = st.history.instructions();
    const size_t history_before = st.history.history().size();

    c.expect(st.guess(3, 0), "guess possible");
    int moves = 0;
    while (moves < 10 && !st.board.is_solved() && logic::single_solve_move(st, 4)) ++moves;
    c.expect(!(st.board == board_before), "guess changed the board");

    st.rollback_round(4);
    st.rollback_round(3);
    c.expect(st.board == board_before, "board equal after rollback");
    c.expect(st.history.instructions() == instructions_before, "instructions equal after rollback");
    c.expect(st.history.history().size() > history_before, "history keeps the abandoned branch");
    c.expect(st.history.history().back().type == LogType::Rollback, "rollback logged");

    c.finish(result, "round 3/4 fully undone");
    return result;
}

inline TestResult test_rollback_leaves_other_rounds() {
    TestResult result;
    result.name = "rollback touches only its own round";
    Checks c;

    RoundBoard b;
    b.mark(0, 2, 1);
    b.mark(10, 3, 2);
    b.mark(20, 4, 3);
    b.rollback(3);
    c.expect(b.solution[0] == 1 && b.solution[20] == 3, "rounds 2 and 4 kept");
    c.expect(b.solution[10] == 0 && b.solution_round[10] == 0, "round 3 cleared");
    c.expect(b.is_possible(1, 11), "round 3 eliminations reopened");
    c.expect(!b.is_possible(0, 1), "round 2 eliminations kept");

    c.finish(result, "other rounds intact");
    return result;
}

inline TestResult test_reset_and_givens() {
    TestResult result;
    result.name = "reset marks givens and rejects conflicts";
    Checks c;

    SudokuSession s(3);
    s.set_record_history(true);
    const Grid puzzle = grid_from(kMediumPuzzle);
    c.expect(s.set_puzzle(puzzle), "valid puzzle accepted");
    c.expect(s.given_count() == 17, "17 givens");
    const std::vector<LogItem> history = s.get_solve_history();
    c.expect(count_log_type(history, LogType::Given) == 17, "one Given item per clue");
    c.expect(!history.empty() && history.front().round == kGivenRound, "givens at round 1");

    c.expect(s.solve(), "solves");
    c.expect(s.puzzle() == puzzle, "puzzle unchanged by solving");
    bool given_rounds = true;
    for (int i = 0; i < kBoardSize; ++i) {
        const size_t p = static_cast<size_t>(i);
        if (puzzle[p] != 0) {
            given_rounds = given_rounds && s.solution()[p] == puzzle[p] && s.state().board.solution_round[p] == kGivenRound;
        }
    }
    c.expect(given_rounds, "givens survive with round 1");

    Grid clash = puzzle;
    clash[1] = 4;  // second 4 in row 0
    c.expect(!s.set_puzzle(clash), "duplicate in a row rejected");

    Grid bad_value{};
    bad_value[0] = 12;
    c.expect(!s.set_puzzle(bad_value), "value above 9 rejected");

    c.finish(result, "givens round-trip");
    return result;
}

inline TestResult test_log_items() {
    TestResult result;
    result.name = "LogItem text and optional position";
    Checks c;

    const LogItem single{2, LogType::Single, 7, 10};
    c.expect(single.row() == std::optional<int>(2) && single.column() == std::optional<int>(2), "1-indexed row/column");
    c.expect(single.description() == "Round: 2 - Mark only possibility for cell (Row: 2 - Column: 2 - Value: 7)",
             "single description: " + single.description());

    const LogItem rollback{5, LogType::Rollback, 0, std::nullopt};
    c.expect(!rollback.row().has_value() && !rollback.column().has_value(), "rollback has no position");
    c.expect(rollback.description() == "Round: 5 - Roll back round", "rollback description: " + rollback.description());

    const LogItem pair{4, LogType::NakedPairRow, 0, 18};
    c.expect(pair.description() == "Round: 4 - Remove possibilities for naked pair in row (Row: 3 - Column: 1)",
             "pair description: " + pair.description());

    SolveHistory h;
    h.set_record(true);
    h.add(LogItem{2, LogType::Single, 1, 0});
    h.add(LogItem{3, LogType::Guess, 2, 1});
    h.add(LogItem{4, LogType::Single, 3, 2});
    h.truncate_round(3);
    c.expect(h.instructions().size() == 3, "round 3 not trailing, nothing removed");
    h.truncate_round(4);
    h.truncate_round(3);
    c.expect(h.instructions().size() == 1 && h.history().size() == 3, "trailing rounds removed, history kept");

    SolveHistory off;
    off.add(LogItem{2, LogType::Single, 1, 0});
    c.expect(!off.enabled() && off.history().empty(), "nothing stored while disabled");

    c.finish(result, "log items well formed");
    return result;
}

inline TestResult test_difficulty_classification() {
    TestResult result;
    result.name = "difficulty from surviving instructions";
    Checks c;

    auto items = [](std::initializer_list<LogType> types) {
        std::vector<LogItem> v;
        for (const LogType t : types) v.push_back(LogItem{2, t, 1, 0});
        return v;
    };

    c.expect(classify_difficulty({}) == Difficulty::Unknown, "empty -> Unknown");
    c.expect(classify_difficulty(items({LogType::Given})) == Difficulty::Unknown, "givens only -> Unknown");
    c.expect(classify_difficulty(items({LogType::Given, LogType::Single})) == Difficulty::Simple, "single -> Simple");
    c.expect(classify_difficulty(items({LogType::Single, LogType::HiddenSingleColumn})) == Difficulty::Easy, "hidden single -> Easy");
    c.expect(classify_difficulty(items({LogType::Single, LogType::NakedPairSection})) == Difficulty::Medium, "naked pair -> Medium");
    c.expect(classify_difficulty(items({LogType::HiddenPairRow})) == Difficulty::Medium, "hidden pair -> Medium");
    c.expect(classify_difficulty(items({LogType::PointingPairTripleColumn})) == Difficulty::Medium, "pointing -> Medium");
    c.expect(classify_difficulty(items({LogType::ColumnBox, LogType::HiddenSingleRow})) == Difficulty::Medium, "box/line -> Medium");
    c.expect(classify_difficulty(items({LogType::Single, LogType::Guess, LogType::RowBox})) == Difficulty::Expert, "guess -> Expert");

    c.finish(result, "classification ladder");
    return result;
}

inline TestResult test_puzzle_io() {
    TestResult result;
    result.name = "puzzle text parsing";
    Checks c;

    Grid g{};
    std::string err;
    c.expect(parse_puzzle_string(kEasyPuzzle, g, &err), "zeros as blanks");
    c.expect(g[7] == 1 && g[0] == 0, "values placed");
    c.expect(!parse_puzzle_string("123", g, &err) && !err.empty(), "too short rejected");
    c.expect(!parse_puzzle_string(std::string(kSimplePuzzle) + "1", g, &err), "too long rejected");

    std::istringstream in(std::string(kSimplePuzzle) + "\n" +
                          " 4 . . | . . . | 8 . 5\n" + std::string(kMediumPuzzle).substr(9) + "\n");
    Grid first{};
    Grid second{};
    Grid third{};
    c.expect(read_puzzle(in, first) && grid_text(first) == kSimplePuzzle, "first puzzle from stream");
    c.expect(read_puzzle(in, second) && grid_text(second) == kMediumPuzzle, "readable rows skip separators");
    c.expect(!read_puzzle(in, third), "end of stream");

    c.finish(result, "input formats");
    return result;
}

inline TestResult test_formatting() {
    TestResult result;
    result.name = "print styles";
    Checks c;

    const Grid g = grid_from(kSimplePuzzle);
    c.expect(puzzle_to_string(g, PrintStyle::OneLine) == std::string(kSimplePuzzle) + "\n", "one-line");
    c.expect(puzzle_to_string(g, PrintStyle::Csv) == std::string(kSimplePuzzle) + ",", "csv");

    const std::string compact = puzzle_to_string(g, PrintStyle::Compact);
    c.expect(compact.substr(0, 10) == "..3.2.6..\n" && compact.size() == 9 * 10 + 1, "compact rows");

    const std::string readable = puzzle_to_string(g, PrintStyle::Readable);
    c.expect(readable.rfind(" . . 3 | . 2 . | 6 . .\n", 0) == 0, "readable first row");
    c.expect(readable.find(kSectionRule) != std::string::npos, "readable section rule");

    const std::vector<LogItem> items = {LogItem{1, LogType::Given, 3, 2}};
    c.expect(history_to_string(items, PrintStyle::OneLine, true) ==
                 "1. Round: 1 - Mark given (Row: 1 - Column: 3 - Value: 3)\n\n", "history listing");
    c.expect(history_to_string({}, PrintStyle::Csv, false) == "History was not recorded. -- ,", "unrecorded csv");

    c.finish(result, "formatting");
    return result;
}

inline TestResult test_arg_parser() {
    TestResult result;
    result.name = "command line parsing";
    Checks c;

    auto parse = [](std::vector<std::string> args) {
        std::vector<char*> argv;
        static std::string prog = "sudoku_rounds";
        argv.push_back(prog.data());
        for (std::string& a : args) argv.push_back(a.data());
        return parse_args(static_cast<int>(argv.size()), argv.data());
    };

    const ParseArgsResult gen = parse({"--generate", "5", "--difficulty", "expert", "--symmetry", "rotate90",
                                       "--csv", "--stats", "--seed", "99"});
    c.expect(gen.ok, "generate args ok: " + gen.error);
    c.expect(gen.cfg.action == RunAction::Generate && gen.cfg.generate_count == 5, "generate count");
    c.expect(gen.cfg.difficulty == Difficulty::Expert && gen.cfg.symmetry == Symmetry::Rotate90, "filters");
    c.expect(gen.cfg.print_style == PrintStyle::Csv && gen.cfg.print_stats, "output options");
    c.expect(gen.cfg.has_seed && gen.cfg.seed == 99, "seed");
    c.expect(gen.cfg.print_puzzle, "generated puzzles printed by default");

    const ParseArgsResult solve = parse({"--solve", "--solution", "--one-line", "--propagator-stats"});
    c.expect(solve.ok && solve.cfg.action == RunAction::Solve && !solve.cfg.print_puzzle, "solve defaults");
    c.expect(solve.cfg.print_propagator_stats && !gen.cfg.print_propagator_stats, "propagator stats flag");

    c.expect(!parse({"--bogus"}).ok, "unknown option");
    c.expect(!parse({"--generate", "x1"}).ok, "bad count");
    c.expect(!parse({"--generate", "--symmetry", "spiral"}).ok, "bad symmetry");
    c.expect(!parse({"--solve", "--difficulty", "easy"}).ok, "difficulty without generate");
    c.expect(!parse({"--generate", "--log-level", "loud"}).ok, "bad log level");

    Symmetry sym = Symmetry::None;
    c.expect(parse_symmetry("Rotate-180", sym) && sym == Symmetry::Rotate180, "normalized symmetry token");

    c.finish(result, "options");
    return result;
}

inline std::vector<TestCase> board_round_tests() {
    return {
        {"BOARD", "Geometry helpers", test_geometry_helpers},
        {"BOARD", "mark stamps", test_mark_stamps_peers},
        {"BOARD", "mark errors", test_mark_errors},
        {"BOARD", "rollback exactness", test_rollback_exactness},
        {"BOARD", "rollback isolation", test_rollback_leaves_other_rounds},
        {"BOARD", "givens", test_reset_and_givens},
        {"BOARD", "log items", test_log_items},
        {"BOARD", "difficulty", test_difficulty_classification},
        {"IO", "puzzle io", test_puzzle_io},
        {"IO", "formatting", test_formatting},
        {"IO", "arg parser", test_arg_parser},
    };
}

} // namespace sudoku_testy
