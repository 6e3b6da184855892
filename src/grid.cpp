#include "grid.hpp"
#include "rule_checker.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

Grid::Grid() {
    cells.fill(0);
    given.fill(false);
}

Grid::Grid(const Values& values) : cells(values) {
    for (int v : cells) {
        if (v < 0 || v > 9) {
            throw std::invalid_argument("Grid value out of range: " + std::to_string(v));
        }
    }
    given.fill(false);
}

Grid Grid::puzzle(const Values& values) {
    Grid g(values);
    for (int i = 0; i < CELL_COUNT; ++i) {
        g.given[i] = g.cells[i] != 0;
    }
    return g;
}

Grid Grid::fromRows(const std::vector<std::vector<int>>& rows) {
    if (rows.size() != N) {
        throw std::invalid_argument("Expected 9 rows, got " + std::to_string(rows.size()));
    }
    Values values{};
    for (int r = 0; r < N; ++r) {
        if (rows[r].size() != N) {
            throw std::invalid_argument("Row " + std::to_string(r) + " does not have 9 columns");
        }
        for (int c = 0; c < N; ++c) values[r * N + c] = rows[r][c];
    }
    return Grid(values);
}

int Grid::index_of(int row, int col) {
    if (row < 0 || row >= N || col < 0 || col >= N) {
        throw std::out_of_range("Cell (" + std::to_string(row) + ", " + std::to_string(col) + ") is outside the grid");
    }
    return row * N + col;
}

Cell Grid::getCell(int row, int col) const {
    int idx = index_of(row, col);
    return Cell{cells[idx], given[idx]};
}

int Grid::value(int row, int col) const {
    return cells[index_of(row, col)];
}

bool Grid::isGiven(int row, int col) const {
    return given[index_of(row, col)];
}

// Rejects givens, out-of-range values and placements that break a row,
// column or box. The grid is untouched on rejection.
bool Grid::setCell(int row, int col, int value) {
    int idx = index_of(row, col);
    if (given[idx]) return false;
    if (value < 0 || value > 9) return false;
    if (!RuleChecker::isPlacementLegal(*this, row, col, value)) return false;

    cells[idx] = value;
    return true;
}

bool Grid::clearCell(int row, int col) {
    int idx = index_of(row, col);
    if (given[idx]) return false;
    cells[idx] = 0;
    return true;
}

void Grid::reset() {
    for (int i = 0; i < CELL_COUNT; ++i) {
        if (!given[i]) cells[i] = 0;
    }
}

bool Grid::isFull() const {
    return emptyCount() == 0;
}

int Grid::clueCount() const {
    return CELL_COUNT - emptyCount();
}

int Grid::emptyCount() const {
    return static_cast<int>(std::count(cells.begin(), cells.end(), 0));
}
