#include "game.hpp"
#include "game_config.hpp"
#include "rule_checker.hpp"

#include <chrono>
#include <iostream>
#include <opencv2/highgui.hpp>

// Extended key codes returned by cv::waitKeyEx (GTK and Win32 backends)
static constexpr int KEY_ESCAPE = 27;
static constexpr int KEY_BACKSPACE = 8;
static constexpr int KEY_DELETE_GTK = 65535;
static constexpr int KEY_DELETE_WIN = 3014656;
static constexpr int KEY_LEFT_GTK = 65361;
static constexpr int KEY_UP_GTK = 65362;
static constexpr int KEY_RIGHT_GTK = 65363;
static constexpr int KEY_DOWN_GTK = 65364;
static constexpr int KEY_LEFT_WIN = 2424832;
static constexpr int KEY_UP_WIN = 2490368;
static constexpr int KEY_RIGHT_WIN = 2555904;
static constexpr int KEY_DOWN_WIN = 2621440;

enum ButtonId {
    BUTTON_NEW = 0,
    BUTTON_UNDO,
    BUTTON_REDO,
    BUTTON_HINT,
    BUTTON_PAUSE,
    BUTTON_LEVEL
};

static PuzzleGenerator makeGenerator(std::optional<unsigned int> seed, GeneratorOptions options) {
    if (seed) return PuzzleGenerator(*seed, options);
    PuzzleGenerator generator;
    generator.setOptions(options);
    return generator;
}

static HintEngine makeHintEngine(std::optional<unsigned int> seed) {
    if (seed) return HintEngine(*seed + 1);
    return HintEngine();
}

Game::Game(Difficulty difficulty, std::optional<unsigned int> seed, GeneratorOptions options)
    : level(difficulty),
      generator(makeGenerator(seed, options)),
      hints(makeHintEngine(seed)),
      moves(MAX_HISTORY_SIZE),
      canvas(renderer.createCanvas())
{
    build_buttons();
    newGame();
}

void Game::build_buttons() {
    const char* labels[] = {"New", "Undo", "Redo", "Hint", "Pause", ""};
    int x = BOARD_OFFSET_X;
    for (const char* label : labels) {
        button_bar.emplace_back(cv::Rect(x, BUTTON_Y, BUTTON_WIDTH, BUTTON_HEIGHT), label);
        x += BUTTON_WIDTH + BUTTON_SPACING;
    }

    button_bar[BUTTON_NEW].setCallback([this] { newGame(); });
    button_bar[BUTTON_UNDO].setCallback([this] { undo(); });
    button_bar[BUTTON_REDO].setCallback([this] { redo(); });
    button_bar[BUTTON_HINT].setCallback([this] { hint(); });
    button_bar[BUTTON_PAUSE].setCallback([this] { togglePause(); });
    button_bar[BUTTON_LEVEL].setCallback([this] { newGame(nextDifficulty(level)); });
}

void Game::run() {
    cv::namedWindow(WINDOW_TITLE, cv::WINDOW_AUTOSIZE);
    cv::setMouseCallback(WINDOW_TITLE, &Game::on_mouse, this);

    const int delay = 1000 / FPS;
    while (!quit) {
        cv::imshow(WINDOW_TITLE, renderFrame());
        int key = cv::waitKeyEx(delay);
        if (key != -1) handleKey(key);
        tick();

        // Closed with the window manager
        if (cv::getWindowProperty(WINDOW_TITLE, cv::WND_PROP_VISIBLE) < 1) break;
    }
    cv::destroyWindow(WINDOW_TITLE);

    std::cout << "Session statistics:\n" << stats.summary() << std::endl;
}

void Game::newGame() {
    auto t_start = std::chrono::high_resolution_clock::now();
    board = generator.generate(level);
    auto t_end = std::chrono::high_resolution_clock::now();
    auto t_ms = std::chrono::duration_cast<std::chrono::milliseconds>(t_end - t_start).count();

    int removed = Grid::CELL_COUNT - board.clueCount();
    if (removed < cellsToRemove(level)) {
        std::cerr << "WARNING: only " << removed << " of " << cellsToRemove(level)
                  << " cells could be removed" << std::endl;
    }
    std::cout << "New " << difficultyName(level) << " game: " << board.clueCount()
              << " clues (generated in " << t_ms << " ms)" << std::endl;

    moves.clear();
    stats.reset();
    clock.start();
    game_state = GameState::Playing;
    selection.reset();
    invalid_cell.reset();
    invalid_frames = 0;
    final_time.clear();
    status_text = "Select a cell and type 1-9";

    button_bar[BUTTON_PAUSE].setText("Pause");
    button_bar[BUTTON_LEVEL].setText(std::string(difficultyName(level)));
}

void Game::newGame(Difficulty difficulty) {
    level = difficulty;
    newGame();
}

bool Game::handleKey(int key) {
    if (key == KEY_ESCAPE || key == 'q') {
        quit = true;
        return false;
    }

    if (key >= '1' && key <= '9') {
        enterValue(key - '0');
    } else if (key == '0' || key == KEY_BACKSPACE || key == KEY_DELETE_GTK || key == KEY_DELETE_WIN) {
        clearSelected();
    } else if (key == KEY_UP_GTK || key == KEY_UP_WIN || key == 'w') {
        moveSelection(-1, 0);
    } else if (key == KEY_DOWN_GTK || key == KEY_DOWN_WIN || key == 's') {
        moveSelection(1, 0);
    } else if (key == KEY_LEFT_GTK || key == KEY_LEFT_WIN || key == 'a') {
        moveSelection(0, -1);
    } else if (key == KEY_RIGHT_GTK || key == KEY_RIGHT_WIN || key == 'd') {
        moveSelection(0, 1);
    } else if (key == 'u') {
        undo();
    } else if (key == 'r') {
        redo();
    } else if (key == 'h') {
        hint();
    } else if (key == 'p') {
        togglePause();
    } else if (key == 'n') {
        newGame();
    }
    return true;
}

void Game::handleMouse(int event, int x, int y) {
    for (Button& button : button_bar) {
        // A callback may start a new game; stop dispatching after a click
        if (button.handleMouse(event, x, y)) return;
    }

    if (event == cv::EVENT_LBUTTONDOWN) {
        if (auto pos = BoardRenderer::cellFromPosition(cv::Point(x, y))) {
            selectCell(pos->first, pos->second);
        }
    }
}

const cv::Mat& Game::renderFrame() {
    RenderState view;
    view.selected = selection;
    view.invalid = invalid_cell;
    view.title = "Sudoku (" + std::string(difficultyName(level)) + ")";
    view.timerText = game_state == GameState::Won ? final_time : clock.formatted();
    view.status = status_text;
    view.paused = game_state == GameState::Paused;
    view.won = game_state == GameState::Won;

    renderer.render(canvas, board, view);
    for (const Button& button : button_bar) button.render(canvas);
    return canvas;
}

// Advances per-frame effects
void Game::tick() {
    if (invalid_frames > 0 && --invalid_frames == 0) {
        invalid_cell.reset();
    }
}

bool Game::selectCell(int row, int col) {
    if (row < 0 || row >= Grid::N || col < 0 || col >= Grid::N) return false;
    if (game_state == GameState::Paused) return false;
    selection = CellPos{row, col};
    return true;
}

void Game::moveSelection(int dRow, int dCol) {
    if (!selection) {
        selectCell(0, 0);
        return;
    }
    int row = (selection->first + dRow + Grid::N) % Grid::N;
    int col = (selection->second + dCol + Grid::N) % Grid::N;
    selectCell(row, col);
}

bool Game::enterValue(int value) {
    if (!is_playing() || !selection) return false;

    auto [row, col] = *selection;
    if (board.isGiven(row, col)) {
        status_text = "That cell is part of the puzzle";
        return false;
    }
    if (board.value(row, col) == value) return false;

    if (!apply_move(makeSetCellMove(board, row, col, value))) {
        stats.recordInvalidMove();
        flash_invalid(*selection);
        status_text = std::to_string(value) + " conflicts with its row, column or box";
        return false;
    }

    stats.recordMove();
    status_text.clear();
    check_won();
    return true;
}

bool Game::clearSelected() {
    if (!is_playing() || !selection) return false;

    auto [row, col] = *selection;
    if (board.isGiven(row, col) || board.value(row, col) == 0) return false;

    if (!apply_move(makeClearCellMove(board, row, col))) return false;
    stats.recordMove();
    status_text.clear();
    return true;
}

bool Game::undo() {
    if (!is_playing()) return false;
    std::string description = moves.lastDescription();
    if (!moves.undo(board)) {
        status_text = "Nothing to undo";
        return false;
    }
    stats.recordUndo();
    status_text = "Undo: " + description;
    return true;
}

bool Game::redo() {
    if (!is_playing()) return false;
    if (!moves.redo(board)) {
        status_text = "Nothing to redo";
        return false;
    }
    stats.recordRedo();
    status_text = "Redo: " + moves.lastDescription();
    check_won();
    return true;
}

// A hint is applied as a regular move so it can be undone
std::optional<Hint> Game::hint() {
    if (!is_playing()) return std::nullopt;

    std::optional<Hint> found = hints.getHint(board);
    if (!found) {
        status_text = "No hint available";
        return std::nullopt;
    }

    if (!apply_move(makeSetCellMove(board, found->row, found->col, found->value))) {
        std::cerr << "ERROR: hint " << found->value << " at (" << found->row << ", " << found->col
                  << ") was rejected by the board" << std::endl;
        return std::nullopt;
    }
    stats.recordHint();
    selection = CellPos{found->row, found->col};
    status_text = "Hint: " + std::to_string(found->value) + " at row " + std::to_string(found->row + 1)
                + ", column " + std::to_string(found->col + 1);
    check_won();
    return found;
}

void Game::togglePause() {
    if (game_state == GameState::Playing) {
        clock.pause();
        game_state = GameState::Paused;
        button_bar[BUTTON_PAUSE].setText("Resume");
        status_text = "Paused";
    } else if (game_state == GameState::Paused) {
        clock.resume();
        game_state = GameState::Playing;
        button_bar[BUTTON_PAUSE].setText("Pause");
        status_text.clear();
    }
}

bool Game::apply_move(const Move& move) {
    return moves.apply(board, move);
}

void Game::flash_invalid(const CellPos& pos) {
    invalid_cell = pos;
    invalid_frames = INVALID_FLASH_FRAMES;
}

void Game::check_won() {
    if (!RuleChecker::isBoardSolved(board)) return;

    final_time = clock.formatted();
    clock.stop();
    game_state = GameState::Won;
    status_text = "Solved in " + final_time + "! Press N for a new game";
    std::cout << "Puzzle solved in " << final_time << "\n" << stats.summary() << std::endl;
}

void Game::on_mouse(int event, int x, int y, int /*flags*/, void* userdata) {
    static_cast<Game*>(userdata)->handleMouse(event, x, y);
}
