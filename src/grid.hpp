#pragma once

#include <array>
#include <vector>

struct Cell {
    int value;
    bool isGiven;
};

// 9x9 board of values (0 = empty) with a per-cell "given" flag.
// Givens are fixed at construction time by Grid::puzzle() and cannot be
// changed afterwards.
class Grid {
public:
    static constexpr int N = 9;
    static constexpr int BOX = 3;
    static constexpr int CELL_COUNT = 81;
    using Values = std::array<int, CELL_COUNT>;

    Grid();
    explicit Grid(const Values& values);

    // Finalize values as a puzzle: every nonzero value becomes a given.
    static Grid puzzle(const Values& values);
    static Grid fromRows(const std::vector<std::vector<int>>& rows);

    Cell getCell(int row, int col) const;
    int value(int row, int col) const;
    bool isGiven(int row, int col) const;

    bool setCell(int row, int col, int value);
    bool clearCell(int row, int col);
    void reset();

    bool isFull() const;
    int clueCount() const;
    int emptyCount() const;
    const Values& values() const { return cells; }

    bool operator==(const Grid& other) const = default;

private:
    static int index_of(int row, int col);

    Values cells;
    std::array<bool, CELL_COUNT> given;
};
