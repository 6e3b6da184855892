#pragma once

#include <string>

class GameStatistics {
public:
    void recordMove() { ++moves; }
    void recordUndo() { ++undos; }
    void recordRedo() { ++redos; }
    void recordHint() { ++hints; }
    void recordInvalidMove() { ++invalid_moves; }
    void reset();

    int movesMade() const { return moves; }
    int undosMade() const { return undos; }
    int redosMade() const { return redos; }
    int hintsUsed() const { return hints; }
    int invalidMoves() const { return invalid_moves; }

    // moves + undos + redos; hints and rejected moves are not actions
    int totalActions() const { return moves + undos + redos; }
    std::string summary() const;

private:
    int moves = 0;
    int undos = 0;
    int redos = 0;
    int hints = 0;
    int invalid_moves = 0;
};
