#pragma once

#include <cstdint>
#include <istream>
#include <string>
#include <string_view>

#include "../core/geometry.h"

namespace sudoku_rounds {

// '1'-'9' are givens, '.' and '0' blanks, -1 for anything else.
inline int puzzle_char_value(char ch) {
    if (ch >= '1' && ch <= '9') return ch - '0';
    if (ch == '.' || ch == '0') return 0;
    return -1;
}

// Fills `out` with the next 81 significant characters of the stream; other
// characters (separators, box rules, line breaks) are skipped. False when
// the stream ends first.
inline bool read_puzzle(std::istream& in, Grid& out) {
    Grid grid{};
    int read = 0;
    char ch = 0;
    while (read < kBoardSize && in.get(ch)) {
        const int v = puzzle_char_value(ch);
        if (v < 0) continue;
        grid[static_cast<size_t>(read++)] = static_cast<uint8_t>(v);
    }
    if (read < kBoardSize) {
        return false;
    }
    out = grid;
    return true;
}

// Strict variant for a single puzzle string: exactly 81 significant
// characters are required.
inline bool parse_puzzle_string(std::string_view text, Grid& out, std::string* err) {
    Grid grid{};
    int read = 0;
    for (const char ch : text) {
        const int v = puzzle_char_value(ch);
        if (v < 0) continue;
        if (read == kBoardSize) {
            if (err != nullptr) *err = "puzzle has more than 81 cells";
            return false;
        }
        grid[static_cast<size_t>(read++)] = static_cast<uint8_t>(v);
    }
    if (read < kBoardSize) {
        if (err != nullptr) *err = "puzzle has only " + std::to_string(read) + " of 81 cells";
        return false;
    }
    out = grid;
    return true;
}

} // namespace sudoku_rounds
