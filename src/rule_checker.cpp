#include "rule_checker.hpp"
#include "grid.hpp"

bool RuleChecker::isPlacementLegal(const Grid& grid, int row, int col, int value) {
    if (value == 0) return true; // clearing is always allowed
    if (value < 1 || value > 9) return false;

    return row_allows(grid, row, col, value) &&
           col_allows(grid, row, col, value) &&
           box_allows(grid, row, col, value);
}

bool RuleChecker::isBoardSolved(const Grid& grid) {
    if (!grid.isFull()) return false;
    return isConsistent(grid);
}

bool RuleChecker::isConsistent(const Grid& grid) {
    for (int r = 0; r < Grid::N; ++r) {
        for (int c = 0; c < Grid::N; ++c) {
            int v = grid.value(r, c);
            if (v != 0 && !isPlacementLegal(grid, r, c, v)) return false;
        }
    }
    return true;
}

bool RuleChecker::row_allows(const Grid& grid, int row, int col, int value) {
    for (int c = 0; c < Grid::N; ++c) {
        if (c != col && grid.value(row, c) == value) return false;
    }
    return true;
}

bool RuleChecker::col_allows(const Grid& grid, int row, int col, int value) {
    for (int r = 0; r < Grid::N; ++r) {
        if (r != row && grid.value(r, col) == value) return false;
    }
    return true;
}

bool RuleChecker::box_allows(const Grid& grid, int row, int col, int value) {
    int boxRow = (row / Grid::BOX) * Grid::BOX;
    int boxCol = (col / Grid::BOX) * Grid::BOX;
    for (int r = boxRow; r < boxRow + Grid::BOX; ++r) {
        for (int c = boxCol; c < boxCol + Grid::BOX; ++c) {
            if (r == row && c == col) continue;
            if (grid.value(r, c) == value) return false;
        }
    }
    return true;
}
