#include "move_history.hpp"

#include <type_traits>

SetCellMove makeSetCellMove(const Grid& grid, int row, int col, int value) {
    return SetCellMove{row, col, grid.value(row, col), value};
}

ClearCellMove makeClearCellMove(const Grid& grid, int row, int col) {
    return ClearCellMove{row, col, grid.value(row, col)};
}

std::string describeMove(const Move& move) {
    return std::visit([](const auto& m) -> std::string {
        using T = std::decay_t<decltype(m)>;
        std::string cell = "(" + std::to_string(m.row) + ", " + std::to_string(m.col) + ")";
        if constexpr (std::is_same_v<T, SetCellMove>) {
            return "Set cell " + cell + " to " + std::to_string(m.newValue);
        } else {
            return "Clear cell " + cell;
        }
    }, move);
}

MoveHistory::MoveHistory(size_t maxSize) : max_size(maxSize) {}

bool MoveHistory::apply(Grid& grid, const Move& move) {
    if (!execute(grid, move)) return false;

    history.push_back(move);
    if (history.size() > max_size) history.pop_front();
    redo_stack.clear();
    return true;
}

bool MoveHistory::undo(Grid& grid) {
    if (!canUndo()) return false;

    Move move = history.back();
    if (!revert(grid, move)) return false;

    history.pop_back();
    redo_stack.push_back(move);
    return true;
}

bool MoveHistory::redo(Grid& grid) {
    if (!canRedo()) return false;

    Move move = redo_stack.back();
    if (!execute(grid, move)) return false;

    redo_stack.pop_back();
    history.push_back(move);
    return true;
}

void MoveHistory::clear() {
    history.clear();
    redo_stack.clear();
}

std::string MoveHistory::lastDescription() const {
    if (!canUndo()) return "";
    return describeMove(history.back());
}

bool MoveHistory::execute(Grid& grid, const Move& move) {
    return std::visit([&grid](const auto& m) -> bool {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, SetCellMove>) {
            return grid.setCell(m.row, m.col, m.newValue);
        } else {
            return grid.clearCell(m.row, m.col);
        }
    }, move);
}

// Put back the value the cell held before the move
bool MoveHistory::revert(Grid& grid, const Move& move) {
    return std::visit([&grid](const auto& m) -> bool {
        if (m.oldValue == 0) return grid.clearCell(m.row, m.col);
        return grid.setCell(m.row, m.col, m.oldValue);
    }, move);
}
