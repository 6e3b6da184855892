#pragma once

#include <cstddef>
#include <deque>
#include <string>
#include <variant>
#include <vector>

#include "grid.hpp"

struct SetCellMove {
    int row;
    int col;
    int oldValue;
    int newValue;
};

struct ClearCellMove {
    int row;
    int col;
    int oldValue;
};

using Move = std::variant<SetCellMove, ClearCellMove>;

SetCellMove makeSetCellMove(const Grid& grid, int row, int col, int value);
ClearCellMove makeClearCellMove(const Grid& grid, int row, int col);
std::string describeMove(const Move& move);

// Undo/redo stacks over reversible cell edits. A move is recorded only if
// the grid accepted it, and recording one discards the redo stack.
class MoveHistory {
public:
    static constexpr size_t DEFAULT_MAX_SIZE = 100;

    explicit MoveHistory(size_t maxSize = DEFAULT_MAX_SIZE);

    bool apply(Grid& grid, const Move& move);
    bool undo(Grid& grid);
    bool redo(Grid& grid);

    bool canUndo() const { return !history.empty(); }
    bool canRedo() const { return !redo_stack.empty(); }
    void clear();

    size_t historySize() const { return history.size(); }
    size_t redoSize() const { return redo_stack.size(); }
    std::string lastDescription() const;

private:
    static bool execute(Grid& grid, const Move& move);
    static bool revert(Grid& grid, const Move& move);

    size_t max_size;
    std::deque<Move> history;
    std::vector<Move> redo_stack;
};
