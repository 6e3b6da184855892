#pragma once

#include <random>

#include "difficulty.hpp"
#include "grid.hpp"
#include "sudoku_solver.hpp"

struct GeneratorOptions {
    // Also require a unique solution before keeping a removed cell.
    // Off by default: removals only need the puzzle to stay solvable.
    bool requireUniqueSolution = false;
};

class PuzzleGenerator {
public:
    PuzzleGenerator();
    explicit PuzzleGenerator(unsigned int seed, GeneratorOptions options = {});

    // Returns a puzzle with up to cellsToRemove empty cells. When the carve
    // runs out of removable positions fewer cells are removed; check
    // clueCount() on the result. Throws std::invalid_argument outside [0, 81).
    // Each carve step runs a full solve, which grows exponentially slow past
    // about 64 removals; keep cellsToRemove at the difficulty presets.
    Grid generate(int cellsToRemove);
    Grid generate(Difficulty difficulty);

    // A random complete, valid grid (no givens).
    Grid generateSolved();

    const GeneratorOptions& options() const { return opts; }
    void setOptions(GeneratorOptions options) { opts = options; }

private:
    void fill_diagonal_box(Grid::Values& values, int box);
    void carve(Grid::Values& values, int target);
    bool removal_keeps_puzzle(const Grid& grid);

    std::mt19937 rng;
    GeneratorOptions opts;
    SudokuSolver solver;
};
