#include "sudoku_solver.hpp"

#include <bit> // Requires C++20

/**
 * Backtracking Sudoku Solver
 * Notes:
 * 1. Bitmasks: Rows, cols, and boxes use 16-bit integers to track used numbers.
 * 2. Fixed order: empty cells are visited in row-major order and candidates
 *    are tried from 1 to 9, so the first solution found is deterministic.
 * 3. Lookup Tables: Pre-computed box indices to avoid division in the hot loop.
 */

SudokuSolver::SudokuSolver() {
    // Precompute box indices to avoid repetitive calculation
    for (int i = 0; i < CELL_COUNT; ++i) {
        int r = i / N;
        int c = i % N;
        box_indices[i] = (r / 3) * 3 + (c / 3);
    }
}

bool SudokuSolver::solve(Grid& grid) {
    if (!load(grid)) return false;
    if (!solve_recursive(0)) return false;

    for (int idx : empty_cells) {
        if (!grid.setCell(idx / N, idx % N, values[idx])) return false;
    }
    return true;
}

int SudokuSolver::countSolutions(const Grid& grid, int limit) {
    if (limit <= 0 || !load(grid)) return 0;

    int found = 0;
    count_recursive(0, limit, found);
    return found;
}

bool SudokuSolver::hasUniqueSolution(const Grid& grid) {
    return countSolutions(grid, 2) == 1;
}

void SudokuSolver::print_grid(const Grid& g, std::ostream& out) {
    for (int r = 0; r < N; ++r) {
        if (r > 0 && r % 3 == 0) out << "------+-------+------\n";
        for (int c = 0; c < N; ++c) {
            if (c > 0 && c % 3 == 0) out << "| ";
            int v = g.value(r, c);
            out << (v == 0 ? '.' : (char)('0' + v)) << " ";
        }
        out << "\n";
    }
}

// Copy grid into the working state. Fails if a value repeats in a row,
// column or box, since the search would only ever see its own writes.
bool SudokuSolver::load(const Grid& grid) {
    values.fill(0);
    row_mask.fill(0);
    col_mask.fill(0);
    box_mask.fill(0);
    empty_cells.clear();
    empty_cells.reserve(CELL_COUNT);

    const Grid::Values& input = grid.values();
    for (int idx = 0; idx < CELL_COUNT; ++idx) {
        int v = input[idx];
        if (v == 0) {
            empty_cells.push_back(idx);
            continue;
        }
        uint16_t bit = 1 << (v - 1);
        if ((row_mask[idx / N] | col_mask[idx % N] | box_mask[box_indices[idx]]) & bit) {
            return false;
        }
        place(idx, v);
    }
    return true;
}

// Mark a number as used in the bitmasks and grid
void SudokuSolver::place(int idx, int val) {
    int r = idx / N;
    int c = idx % N;
    int b = box_indices[idx];
    uint16_t bit = 1 << (val - 1);

    values[idx] = val;
    row_mask[r] |= bit;
    col_mask[c] |= bit;
    box_mask[b] |= bit;
}

// Unmark a number (backtracking)
void SudokuSolver::remove(int idx, int val) {
    int r = idx / N;
    int c = idx % N;
    int b = box_indices[idx];
    uint16_t bit = 1 << (val - 1);

    values[idx] = 0;
    row_mask[r] &= ~bit;
    col_mask[c] &= ~bit;
    box_mask[b] &= ~bit;
}

// Get a bitmask of valid moves for a specific cell index
// Returns 9 bits where 1 means "available"
[[nodiscard]] uint16_t SudokuSolver::get_candidates(int idx) const {
    int r = idx / N;
    int c = idx % N;
    int b = box_indices[idx];

    // OR the masks together to get used numbers, then NOT to get available
    return ~(row_mask[r] | col_mask[c] | box_mask[b]) & 0x1FF;
}

// k is the position in empty_cells (row-major) of the cell to fill next
bool SudokuSolver::solve_recursive(size_t k) {
    if (k == empty_cells.size()) {
        return true; // All cells filled
    }

    int current_cell_idx = empty_cells[k];
    uint16_t mask = get_candidates(current_cell_idx);

    // Lowest set bit first: candidates go 1..9
    while (mask) {
        int val = std::countr_zero(mask) + 1;

        place(current_cell_idx, val);

        if (solve_recursive(k + 1)) {
            return true;
        }

        remove(current_cell_idx, val);

        mask &= (mask - 1);
    }

    return false;
}

void SudokuSolver::count_recursive(size_t k, int limit, int& found) {
    if (k == empty_cells.size()) {
        ++found;
        return;
    }

    int current_cell_idx = empty_cells[k];
    uint16_t mask = get_candidates(current_cell_idx);

    while (mask && found < limit) {
        int val = std::countr_zero(mask) + 1;
        place(current_cell_idx, val);
        count_recursive(k + 1, limit, found);
        remove(current_cell_idx, val);
        mask &= (mask - 1);
    }
}
