#include "hint_engine.hpp"

#include <utility>
#include <vector>

HintEngine::HintEngine() : rng(std::random_device{}()) {}

HintEngine::HintEngine(unsigned int seed) : rng(seed) {}

std::optional<Hint> HintEngine::getHint(const Grid& grid) {
    std::vector<std::pair<int, int>> empty;
    for (int r = 0; r < Grid::N; ++r) {
        for (int c = 0; c < Grid::N; ++c) {
            if (grid.value(r, c) == 0) empty.emplace_back(r, c);
        }
    }
    if (empty.empty()) return std::nullopt;

    Grid solved = grid;
    if (!solver.solve(solved)) return std::nullopt;

    std::uniform_int_distribution<size_t> pick(0, empty.size() - 1);
    auto [row, col] = empty[pick(rng)];
    return Hint{row, col, solved.value(row, col)};
}

int HintEngine::countAvailableHints(const Grid& grid) const {
    return grid.emptyCount();
}
