#pragma once

class Grid;

// Stateless Sudoku rule predicates. A cell never conflicts with itself.
class RuleChecker {
public:
    RuleChecker() = delete;

    static bool isPlacementLegal(const Grid& grid, int row, int col, int value);
    static bool isBoardSolved(const Grid& grid);
    static bool isConsistent(const Grid& grid);

private:
    static bool row_allows(const Grid& grid, int row, int col, int value);
    static bool col_allows(const Grid& grid, int row, int col, int value);
    static bool box_allows(const Grid& grid, int row, int col, int value);
};
