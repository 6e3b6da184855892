#pragma once

#include <optional>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

#include "board_renderer.hpp"
#include "button.hpp"
#include "difficulty.hpp"
#include "game_statistics.hpp"
#include "game_timer.hpp"
#include "grid.hpp"
#include "hint_engine.hpp"
#include "move_history.hpp"
#include "puzzle_generator.hpp"

enum class GameState {
    Playing,
    Paused,
    Won
};

// Game controller: owns the live grid and every collaborator, maps input
// to moves and produces frames. Input handling and rendering work without
// a window; run() adds the HighGUI loop.
class Game {
public:
    explicit Game(Difficulty difficulty = Difficulty::Easy,
                  std::optional<unsigned int> seed = std::nullopt,
                  GeneratorOptions options = {});

    // Buttons call back into this object
    Game(const Game&) = delete;
    Game& operator=(const Game&) = delete;

    void run();

    void newGame();
    void newGame(Difficulty difficulty);

    // Returns false once quit was requested
    bool handleKey(int key);
    void handleMouse(int event, int x, int y);
    const cv::Mat& renderFrame();
    void tick();

    bool selectCell(int row, int col);
    void moveSelection(int dRow, int dCol);
    bool enterValue(int value);
    bool clearSelected();
    bool undo();
    bool redo();
    std::optional<Hint> hint();
    void togglePause();

    const Grid& grid() const { return board; }
    GameState state() const { return game_state; }
    Difficulty difficulty() const { return level; }
    std::optional<CellPos> selected() const { return selection; }
    const std::string& status() const { return status_text; }
    const GameStatistics& statistics() const { return stats; }
    const MoveHistory& history() const { return moves; }
    const GameTimer& timer() const { return clock; }
    const std::vector<Button>& buttons() const { return button_bar; }
    bool quitRequested() const { return quit; }

private:
    void build_buttons();
    bool apply_move(const Move& move);
    void flash_invalid(const CellPos& pos);
    void check_won();
    bool is_playing() const { return game_state == GameState::Playing; }

    static void on_mouse(int event, int x, int y, int flags, void* userdata);

    Difficulty level;
    PuzzleGenerator generator;
    HintEngine hints;
    Grid board;
    MoveHistory moves;
    GameTimer clock;
    GameStatistics stats;
    BoardRenderer renderer;
    std::vector<Button> button_bar;
    cv::Mat canvas;

    GameState game_state = GameState::Playing;
    std::optional<CellPos> selection;
    std::optional<CellPos> invalid_cell;
    int invalid_frames = 0;
    std::string status_text;
    std::string final_time;
    bool quit = false;
};
