#include "game_statistics.hpp"

#include <sstream>

void GameStatistics::reset() {
    moves = 0;
    undos = 0;
    redos = 0;
    hints = 0;
    invalid_moves = 0;
}

std::string GameStatistics::summary() const {
    std::ostringstream oss;
    oss << "Moves: " << moves << "\n"
        << "Undos: " << undos << "\n"
        << "Redos: " << redos << "\n"
        << "Hints: " << hints << "\n"
        << "Invalid Moves: " << invalid_moves << "\n"
        << "Total Actions: " << totalActions();
    return oss.str();
}
