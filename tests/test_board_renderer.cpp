#include "board_renderer.hpp"
#include "button.hpp"
#include "game_config.hpp"
#include "test_utils.hpp"

#include <opencv2/highgui.hpp>

static bool pixelIs(const cv::Mat& canvas, cv::Point p, const cv::Scalar& color) {
    cv::Vec3b px = canvas.at<cv::Vec3b>(p);
    return px[0] == color[0] && px[1] == color[1] && px[2] == color[2];
}

// A point inside the cell, clear of grid lines and the centred digit
static cv::Point cellCorner(int row, int col) {
    cv::Rect r = BoardRenderer::cellRect(row, col);
    return {r.x + 10, r.y + 10};
}

int main() {
    // Pixel to cell mapping
    check(!BoardRenderer::cellFromPosition({0, 0}).has_value(), "header is outside the board");
    check(!BoardRenderer::cellFromPosition({BOARD_OFFSET_X + BOARD_PIXELS, BOARD_OFFSET_Y}).has_value(),
          "right edge is outside the board");
    auto topLeft = BoardRenderer::cellFromPosition({BOARD_OFFSET_X, BOARD_OFFSET_Y});
    check(topLeft && *topLeft == CellPos(0, 0), "board origin is cell (0, 0)");
    auto somewhere = BoardRenderer::cellFromPosition({BOARD_OFFSET_X + 2 * CELL_SIZE + 5, BOARD_OFFSET_Y + 7 * CELL_SIZE + 59});
    check(somewhere && *somewhere == CellPos(7, 2), "pixel maps to (row 7, col 2)");
    auto last = BoardRenderer::cellFromPosition({BOARD_OFFSET_X + BOARD_PIXELS - 1, BOARD_OFFSET_Y + BOARD_PIXELS - 1});
    check(last && *last == CellPos(8, 8), "last pixel is cell (8, 8)");

    // Highlights
    BoardRenderer renderer;
    cv::Mat canvas = renderer.createCanvas();
    check(canvas.rows == SCREEN_HEIGHT && canvas.cols == SCREEN_WIDTH && canvas.type() == CV_8UC3,
          "canvas has the window size");

    Grid grid;
    check(grid.setCell(0, 0, 7) && grid.setCell(8, 8, 7), "two sevens in unrelated cells");

    RenderState state;
    state.title = "Sudoku (Easy)";
    state.selected = CellPos{0, 0};
    state.invalid = CellPos{2, 3};
    renderer.render(canvas, grid, state);

    check(pixelIs(canvas, cellCorner(0, 0), CELL_SELECTED_COLOR), "selected cell is highlighted");
    check(pixelIs(canvas, cellCorner(8, 8), CELL_HIGHLIGHT_COLOR), "cell with the selected digit is highlighted");
    check(pixelIs(canvas, cellCorner(2, 3), CELL_INVALID_COLOR), "invalid cell flashes");
    check(pixelIs(canvas, cellCorner(5, 5), BG_COLOR), "other cells keep the background");

    // Thick box border
    cv::Point border(BOARD_OFFSET_X + 3 * CELL_SIZE, BOARD_OFFSET_Y + CELL_SIZE / 2 - 20);
    check(pixelIs(canvas, border, GRID_COLOR), "box border is drawn");

    // Paused hides the board contents
    state.paused = true;
    renderer.render(canvas, grid, state);
    check(pixelIs(canvas, cellCorner(0, 0), LIGHT_GRAY), "paused board is covered");

    // Rendering into an empty Mat allocates the canvas
    cv::Mat fresh;
    renderer.render(fresh, grid, RenderState{});
    check(fresh.size() == cv::Size(SCREEN_WIDTH, SCREEN_HEIGHT), "render allocates an empty canvas");

    // Buttons
    int clicks = 0;
    Button button(cv::Rect(100, 600, 80, 30), "Hint", [&clicks] { ++clicks; });
    check(button.text() == "Hint", "button label");

    button.handleMouse(cv::EVENT_MOUSEMOVE, 120, 610);
    check(button.isHovered(), "hover inside the button");
    check(!button.handleMouse(cv::EVENT_LBUTTONDOWN, 120, 610), "press is not a click yet");
    check(button.isPressed(), "button is pressed");
    check(button.handleMouse(cv::EVENT_LBUTTONUP, 121, 611), "release inside is a click");
    check(clicks == 1 && !button.isPressed(), "callback fired once");

    button.handleMouse(cv::EVENT_LBUTTONDOWN, 120, 610);
    check(!button.handleMouse(cv::EVENT_LBUTTONUP, 10, 10), "release outside is not a click");
    check(clicks == 1, "callback not fired when released outside");

    check(!button.handleMouse(cv::EVENT_LBUTTONUP, 120, 610), "release without press is not a click");
    button.handleMouse(cv::EVENT_MOUSEMOVE, 5, 5);
    check(!button.isHovered(), "hover cleared when leaving");

    cv::Mat surface = renderer.createCanvas();
    button.render(surface);
    check(pixelIs(surface, {105, 605}, LIGHT_GRAY), "idle button fill");
    button.handleMouse(cv::EVENT_MOUSEMOVE, 120, 610);
    button.render(surface);
    check(pixelIs(surface, {105, 605}, LIGHT_BLUE), "hovered button fill");

    return finish("test_board_renderer");
}
