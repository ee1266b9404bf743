//Author copyright Marcin Matysek (Rewertyn)
#pragma once

#include <array>
#include <cstdint>

namespace sudoku_rounds {

inline constexpr int kGridSize = 3;
inline constexpr int kRowColSecSize = kGridSize * kGridSize;
inline constexpr int kSecGroupSize = kRowColSecSize * kGridSize;
inline constexpr int kBoardSize = kRowColSecSize * kRowColSecSize;
inline constexpr int kPossibilitySize = kBoardSize * kRowColSecSize;

using Grid = std::array<uint8_t, kBoardSize>;

enum class HouseKind : uint8_t {
    Row = 0,
    Column = 1,
    Section = 2
};

inline constexpr int cell_to_row(int cell) {
    return cell / kRowColSecSize;
}

inline constexpr int cell_to_column(int cell) {
    return cell % kRowColSecSize;
}

inline constexpr int cell_to_section(int cell) {
    return (cell / kSecGroupSize * kGridSize) + (cell_to_column(cell) / kGridSize);
}

// Upper left cell of the section containing the given cell.
inline constexpr int cell_to_section_start_cell(int cell) {
    return (cell / kSecGroupSize * kSecGroupSize) + (cell_to_column(cell) / kGridSize * kGridSize);
}

inline constexpr int row_column_to_cell(int row, int column) {
    return row * kRowColSecSize + column;
}

inline constexpr int section_to_first_cell(int section) {
    return (section % kGridSize * kGridSize) + (section / kGridSize * kSecGroupSize);
}

// offset 0-8 walks the section left to right, top to bottom.
inline constexpr int section_to_cell(int section, int offset) {
    return section_to_first_cell(section) + ((offset / kGridSize) * kRowColSecSize) + (offset % kGridSize);
}

// value_index is 0-8 (value - 1).
inline constexpr int possibility_index(int value_index, int cell) {
    return value_index + (kRowColSecSize * cell);
}

inline constexpr int house_cell(HouseKind kind, int house, int offset) {
    switch (kind) {
        case HouseKind::Row: return row_column_to_cell(house, offset);
        case HouseKind::Column: return row_column_to_cell(offset, house);
        case HouseKind::Section: return section_to_cell(house, offset);
    }
    return 0;
}

inline constexpr int house_of_cell(HouseKind kind, int cell) {
    switch (kind) {
        case HouseKind::Row: return cell_to_row(cell);
        case HouseKind::Column: return cell_to_column(cell);
        case HouseKind::Section: return cell_to_section(cell);
    }
    return 0;
}

static_assert(cell_to_section(80) == 8, "section arithmetic");
static_assert(section_to_cell(4, 4) == 40, "section offset arithmetic");
static_assert(cell_to_section_start_cell(50) == 30, "section start arithmetic");

} // namespace sudoku_rounds
