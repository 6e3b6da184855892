#pragma once

#include <optional>
#include <random>

#include "grid.hpp"
#include "sudoku_solver.hpp"

struct Hint {
    int row;
    int col;
    int value;
};

class HintEngine {
public:
    HintEngine();
    explicit HintEngine(unsigned int seed);

    // Correct value for a random empty cell, or std::nullopt when the grid
    // is full or can no longer be solved. The grid itself is not modified.
    std::optional<Hint> getHint(const Grid& grid);

    int countAvailableHints(const Grid& grid) const;

private:
    std::mt19937 rng;
    SudokuSolver solver;
};
