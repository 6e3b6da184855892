#pragma once

#include <array>
#include <cstdint>
#include <iostream>
#include <vector>

#include "grid.hpp"

class SudokuSolver {
public:
    static constexpr int N = Grid::N;
    static constexpr int CELL_COUNT = Grid::CELL_COUNT;

    SudokuSolver();

    // Fills every empty cell of grid in place. Returns false when the grid
    // has no solution or already contains a duplicate; grid contents are
    // then unspecified.
    bool solve(Grid& grid);

    // Number of solutions reachable from grid, stopping once limit is hit.
    int countSolutions(const Grid& grid, int limit);
    bool hasUniqueSolution(const Grid& grid);

    static void print_grid(const Grid& g, std::ostream& out = std::cout);

private:
    Grid::Values values;
    std::array<uint16_t, N> row_mask;
    std::array<uint16_t, N> col_mask;
    std::array<uint16_t, N> box_mask;
    std::array<int, CELL_COUNT> box_indices;
    std::vector<int> empty_cells;

    bool load(const Grid& grid);
    void place(int idx, int val);
    void remove(int idx, int val);
    uint16_t get_candidates(int idx) const;
    bool solve_recursive(size_t k);
    void count_recursive(size_t k, int limit, int& found);
};
