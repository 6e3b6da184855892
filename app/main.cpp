#include <iostream>
#include <optional>
#include <string>
#include <chrono>

#include "difficulty.hpp"
#include "game.hpp"
#include "puzzle_generator.hpp"
#include "rule_checker.hpp"
#include "sudoku_solver.hpp"

struct Options {
    Difficulty difficulty = Difficulty::Easy;
    std::optional<unsigned int> seed;
    bool unique = false;
    bool print = false;
};

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [easy|medium|hard] [--seed N] [--unique] [--print]" << std::endl;
    std::cerr << "  --seed N   reproducible puzzles" << std::endl;
    std::cerr << "  --unique   only keep removals that leave a single solution (slower)" << std::endl;
    std::cerr << "  --print    print a puzzle and its solution instead of opening the game window" << std::endl;
}

std::optional<Options> parseArgs(int argc, char* argv[]) {
    Options opts;
    bool haveDifficulty = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--unique") {
            opts.unique = true;
        } else if (arg == "--print") {
            opts.print = true;
        } else if (arg == "--seed") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --seed needs a value" << std::endl;
                return std::nullopt;
            }
            try {
                opts.seed = static_cast<unsigned int>(std::stoul(argv[++i]));
            } catch (const std::exception&) {
                std::cerr << "Error: invalid seed '" << argv[i] << "'" << std::endl;
                return std::nullopt;
            }
        } else if (auto difficulty = parseDifficulty(arg); difficulty && !haveDifficulty) {
            opts.difficulty = *difficulty;
            haveDifficulty = true;
        } else {
            std::cerr << "Error: unexpected argument '" << arg << "'" << std::endl;
            return std::nullopt;
        }
    }
    return opts;
}

// Headless mode: generate, print, solve, print
int printPuzzle(const Options& opts) {
    GeneratorOptions genOptions;
    genOptions.requireUniqueSolution = opts.unique;
    PuzzleGenerator generator = opts.seed ? PuzzleGenerator(*opts.seed, genOptions) : PuzzleGenerator();
    generator.setOptions(genOptions);

    // --- 1. Puzzle Generation ---
    auto t1_start = std::chrono::high_resolution_clock::now();
    Grid puzzle = generator.generate(opts.difficulty);
    auto t1_end = std::chrono::high_resolution_clock::now();
    auto t1_ms = std::chrono::duration_cast<std::chrono::milliseconds>(t1_end - t1_start).count();
    std::cout << "Step 1 (Puzzle Generation) took: " << t1_ms << " ms" << std::endl;

    std::cout << difficultyName(opts.difficulty) << " puzzle (" << puzzle.clueCount() << " clues):" << std::endl;
    SudokuSolver::print_grid(puzzle);

    // --- 2. Sudoku Solver ---
    SudokuSolver solver;
    Grid solution = puzzle;
    auto t2_start = std::chrono::high_resolution_clock::now();
    bool success = solver.solve(solution);
    auto t2_end = std::chrono::high_resolution_clock::now();
    auto t2_us = std::chrono::duration_cast<std::chrono::microseconds>(t2_end - t2_start).count();
    std::cout << "Step 2 (Sudoku Solving) took: " << t2_us << " us" << std::endl;

    if (!success || !RuleChecker::isBoardSolved(solution)) {
        std::cerr << "ERROR: generated puzzle could not be solved" << std::endl;
        return 1;
    }

    std::cout << "\nSolution:" << std::endl;
    SudokuSolver::print_grid(solution);
    if (opts.unique) {
        std::cout << "Unique solution: " << (solver.hasUniqueSolution(puzzle) ? "yes" : "no") << std::endl;
    }
    return 0;
}

int main(int argc, char* argv[]) {
    std::optional<Options> opts = parseArgs(argc, argv);
    if (!opts) {
        printUsage(argv[0]);
        return -1;
    }

    try {
        if (opts->print) return printPuzzle(*opts);

        GeneratorOptions genOptions;
        genOptions.requireUniqueSolution = opts->unique;
        Game game(opts->difficulty, opts->seed, genOptions);
        game.run();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return -1;
    }

    return 0;
}
