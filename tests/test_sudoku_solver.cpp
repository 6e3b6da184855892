#include "sudoku_solver.hpp"
#include "rule_checker.hpp"
#include "test_utils.hpp"
#include <iostream>
#include <vector>
#include <chrono>

int main() {
    SudokuSolver solver;

    // Classic example puzzle (0 represents an empty cell)
    Grid puzzle = classicPuzzle();

    std::cout << "Solving puzzle:\n";
    SudokuSolver::print_grid(puzzle);

    auto start = std::chrono::high_resolution_clock::now();
    Grid solved = puzzle;
    bool found = solver.solve(solved);
    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double, std::micro> elapsed = end - start;

    std::cout << "\nStatus: " << (found ? "Solved" : "Unsolvable") << "\n";
    std::cout << "Time: " << elapsed.count() << " microseconds\n\n";
    if (found) SudokuSolver::print_grid(solved);

    check(found, "classic puzzle solves");
    check(solved.isFull(), "solved grid has no zeros");
    check(RuleChecker::isBoardSolved(solved), "solved grid passes every rule check");
    check(solved.values() == classicSolution().values(), "classic puzzle reaches its known solution");
    for (int r = 0; r < Grid::N; ++r) {
        for (int c = 0; c < Grid::N; ++c) {
            if (puzzle.isGiven(r, c)) {
                check(solved.isGiven(r, c) && solved.value(r, c) == puzzle.value(r, c), "givens are preserved");
            }
        }
    }

    // Empty grid: complete, valid and deterministic
    Grid empty;
    check(solver.solve(empty), "empty grid solves");
    check(RuleChecker::isBoardSolved(empty), "solution of empty grid is valid");
    for (int c = 0; c < Grid::N; ++c) {
        check(empty.value(0, c) == c + 1, "first row of the first solution is 1..9");
    }
    Grid again;
    check(solver.solve(again) && again == empty, "solving the empty grid twice gives the same solution");

    // Already solved grid: success without mutation
    Grid complete = classicSolution();
    Grid before = complete;
    check(solver.solve(complete), "solved grid is accepted");
    check(complete == before, "solving a solved grid does not mutate it");

    // Duplicate among preexisting values is rejected up front
    Grid::Values dup{};
    dup[0] = 5;
    dup[8] = 5;
    Grid corrupted(dup);
    check(!solver.solve(corrupted), "grid with a duplicate in a row is rejected");
    check(solver.countSolutions(corrupted, 10) == 0, "grid with a duplicate has no solutions");

    // Consistent but unsolvable: (0,8) needs a 9 that column 8 already holds
    Grid::Values stuck{};
    for (int c = 0; c < 8; ++c) stuck[c] = c + 1;
    stuck[1 * Grid::N + 8] = 9;
    Grid dead(stuck);
    check(RuleChecker::isConsistent(dead), "dead-end grid has no duplicates");
    check(!solver.solve(dead), "dead-end grid is unsolvable");

    // Solution counting
    check(solver.countSolutions(classicPuzzle(), 10) == 1, "classic puzzle has exactly one solution");
    check(solver.hasUniqueSolution(classicPuzzle()), "classic puzzle is unique");
    check(solver.countSolutions(Grid(), 5) == 5, "empty grid count stops at the limit");
    check(!solver.hasUniqueSolution(Grid()), "empty grid is not unique");
    check(solver.countSolutions(classicSolution(), 3) == 1, "a full grid is its own single solution");

    // Counting works on a copy
    Grid counted = classicPuzzle();
    solver.countSolutions(counted, 2);
    check(counted == classicPuzzle(), "countSolutions leaves the grid untouched");

    return finish("test_sudoku_solver");
}
