#include "hint_engine.hpp"
#include "rule_checker.hpp"
#include "sudoku_solver.hpp"
#include "test_utils.hpp"

int main() {
    HintEngine hints(42);
    SudokuSolver solver;

    // Full grid: nothing to hint
    check(!hints.getHint(classicSolution()).has_value(), "no hint on a full grid");
    check(hints.countAvailableHints(classicSolution()) == 0, "full grid has no available hints");

    // Exactly one empty cell
    Grid::Values values = classicSolution().values();
    values[4 * Grid::N + 4] = 0;
    Grid oneGap = Grid::puzzle(values);
    Grid expected = oneGap;
    check(solver.solve(expected), "one-gap grid solves");

    std::optional<Hint> hint = hints.getHint(oneGap);
    check(hint.has_value(), "hint for a single empty cell");
    if (hint) {
        check(hint->row == 4 && hint->col == 4, "hint points at the empty cell");
        check(hint->value == expected.value(4, 4), "hint value matches the solver");
        check(hint->value == 5, "hint value is the classic solution's centre");
    }

    // Partially filled puzzle: hints are correct and side-effect free
    Grid puzzle = classicPuzzle();
    Grid before = puzzle;
    Grid solution = classicSolution();
    check(hints.countAvailableHints(puzzle) == puzzle.emptyCount(), "available hints equal empty cells");
    for (int i = 0; i < 20; ++i) {
        std::optional<Hint> h = hints.getHint(puzzle);
        check(h.has_value(), "classic puzzle always has a hint");
        if (!h) break;
        check(before.value(h->row, h->col) == 0, "hint targets an empty cell");
        check(h->value == solution.value(h->row, h->col), "hint value is correct");
    }
    check(puzzle == before, "getHint does not modify the caller's grid");

    // Unsolvable position: no hint
    Grid::Values stuck{};
    for (int c = 0; c < 8; ++c) stuck[c] = c + 1;
    stuck[1 * Grid::N + 8] = 9;
    check(!hints.getHint(Grid(stuck)).has_value(), "no hint when the grid cannot be solved");

    // Filling a puzzle with hints alone ends in a solved board
    Grid play = classicPuzzle();
    for (int i = 0; i < 81 && !play.isFull(); ++i) {
        std::optional<Hint> h = hints.getHint(play);
        if (!h) break;
        check(play.setCell(h->row, h->col, h->value), "hint value is accepted by the grid");
    }
    check(RuleChecker::isBoardSolved(play), "repeated hints solve the puzzle");

    return finish("test_hint_engine");
}
