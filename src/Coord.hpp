#pragma once
#include "Triangular.hpp"

// Row and column of a hole, both 1-based. Row r has r columns.
struct Coord {
    int row{};
    int col{};
    bool operator==(const Coord& o) const noexcept { return row==o.row && col==o.col; }
    bool operator!=(const Coord& o) const noexcept { return !(*this==o); }
};

inline Coord coord_of(int pos) {
    int row = row_of(pos);
    return {row, pos - static_cast<int>(row_triangular(row - 1))};
}

// 0 when (row, col) is not a hole of any triangle
inline int pos_at(int row, int col) {
    if (row < 1 || col < 1 || col > row) return 0;
    return static_cast<int>(row_triangular(row - 1)) + col;
}
