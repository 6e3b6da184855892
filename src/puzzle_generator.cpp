#include "puzzle_generator.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <string>

PuzzleGenerator::PuzzleGenerator() : rng(std::random_device{}()) {}

PuzzleGenerator::PuzzleGenerator(unsigned int seed, GeneratorOptions options)
    : rng(seed), opts(options) {}

Grid PuzzleGenerator::generate(int cellsToRemove) {
    if (cellsToRemove < 0 || cellsToRemove >= Grid::CELL_COUNT) {
        throw std::invalid_argument("cellsToRemove must be in [0, 81), got " + std::to_string(cellsToRemove));
    }

    Grid solved = generateSolved();
    Grid::Values values = solved.values();
    carve(values, cellsToRemove);
    return Grid::puzzle(values);
}

Grid PuzzleGenerator::generate(Difficulty difficulty) {
    return generate(cellsToRemove(difficulty));
}

// The three diagonal boxes share no row, column or box, so each one can be
// seeded with an independent permutation before the solver fills the rest.
Grid PuzzleGenerator::generateSolved() {
    Grid::Values values{};
    for (int box = 0; box < Grid::BOX; ++box) {
        fill_diagonal_box(values, box);
    }

    Grid grid(values);
    if (!solver.solve(grid)) {
        throw std::runtime_error("Failed to complete a grid from the seeded diagonal boxes");
    }
    return grid;
}

void PuzzleGenerator::fill_diagonal_box(Grid::Values& values, int box) {
    std::array<int, Grid::N> digits;
    std::iota(digits.begin(), digits.end(), 1);
    std::shuffle(digits.begin(), digits.end(), rng);

    int origin = box * Grid::BOX;
    int k = 0;
    for (int r = origin; r < origin + Grid::BOX; ++r) {
        for (int c = origin; c < origin + Grid::BOX; ++c) {
            values[r * Grid::N + c] = digits[k++];
        }
    }
}

// Visit positions in a random order, clearing each one whose removal still
// leaves a solvable puzzle. Stops early at target; callers read the clue
// count back when the positions run out first.
void PuzzleGenerator::carve(Grid::Values& values, int target) {
    std::array<int, Grid::CELL_COUNT> order;
    std::iota(order.begin(), order.end(), 0);
    std::shuffle(order.begin(), order.end(), rng);

    int removed = 0;
    for (int idx : order) {
        if (removed >= target) break;
        if (values[idx] == 0) continue;

        int old = values[idx];
        values[idx] = 0;

        if (removal_keeps_puzzle(Grid(values))) {
            ++removed;
        } else {
            values[idx] = old;
        }
    }
}

bool PuzzleGenerator::removal_keeps_puzzle(const Grid& grid) {
    Grid clone = grid;
    if (!solver.solve(clone)) return false;
    if (opts.requireUniqueSolution) return solver.hasUniqueSolution(grid);
    return true;
}
