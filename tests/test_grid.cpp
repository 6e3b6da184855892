#include "grid.hpp"
#include "test_utils.hpp"

#include <stdexcept>

int main() {
    Grid empty;
    check(empty.emptyCount() == 81 && empty.clueCount() == 0, "new grid is empty");
    check(!empty.isFull(), "new grid is not full");
    check(!empty.isGiven(4, 4), "new grid has no givens");

    // Editable cells
    Grid grid;
    check(grid.setCell(0, 0, 5), "set an empty cell");
    Cell cell = grid.getCell(0, 0);
    check(cell.value == 5 && !cell.isGiven, "getCell reports value and given flag");
    check(grid.setCell(0, 0, 6), "overwrite a user value");
    check(grid.setCell(0, 0, 0), "setting 0 clears");
    check(grid.value(0, 0) == 0, "cell is empty after setting 0");

    // Values outside 0..9 are rejected without mutation
    check(!grid.setCell(1, 1, 10), "value 10 is rejected");
    check(!grid.setCell(1, 1, -1), "negative value is rejected");
    check(grid.value(1, 1) == 0, "rejected value leaves the cell empty");

    // Rule violations are rejected
    check(grid.setCell(2, 2, 7), "place a 7");
    check(!grid.setCell(2, 8, 7), "same row duplicate is rejected");
    check(!grid.setCell(8, 2, 7), "same column duplicate is rejected");
    check(!grid.setCell(0, 0, 7), "same box duplicate is rejected");
    check(grid.value(2, 8) == 0 && grid.value(8, 2) == 0 && grid.value(0, 0) == 0,
          "rejected placements do not mutate");
    check(grid.setCell(2, 2, 7), "re-setting the same value does not self-conflict");

    // Givens are immutable
    Grid puzzle = classicPuzzle();
    Grid before = puzzle;
    check(puzzle.isGiven(0, 0) && puzzle.value(0, 0) == 5, "nonzero puzzle values are givens");
    check(!puzzle.isGiven(0, 2), "empty puzzle cells are not givens");
    check(!puzzle.setCell(0, 0, 1), "setCell on a given fails");
    check(!puzzle.setCell(0, 0, 5), "setCell on a given fails even with its own value");
    check(!puzzle.clearCell(0, 0), "clearCell on a given fails");
    check(puzzle == before, "given cells are left byte-for-byte unchanged");

    // reset() keeps givens only
    check(puzzle.setCell(0, 2, 4), "fill an editable cell");
    check(puzzle.clueCount() == before.clueCount() + 1, "clue count includes user values");
    puzzle.reset();
    check(puzzle == before, "reset restores the original puzzle");

    // clearCell on editable cells
    check(puzzle.setCell(0, 2, 4) && puzzle.clearCell(0, 2), "clear a user value");
    check(puzzle.value(0, 2) == 0, "cell empty after clearCell");

    // Full grid
    Grid solved = classicSolution();
    check(solved.isFull() && solved.emptyCount() == 0, "solution grid is full");

    // Bad input
    bool threw = false;
    try {
        grid.value(9, 0);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    check(threw, "row 9 is out of range");

    threw = false;
    try {
        grid.setCell(0, -1, 1);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    check(threw, "negative column is out of range");

    threw = false;
    try {
        Grid::fromRows({{1, 2, 3}});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    check(threw, "fromRows rejects the wrong shape");

    threw = false;
    try {
        Grid::Values values{};
        values[3] = 12;
        Grid bad(values);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    check(threw, "constructor rejects values above 9");

    return finish("test_grid");
}
