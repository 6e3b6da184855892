#include "board_renderer.hpp"
#include "game_config.hpp"

#include <opencv2/imgproc.hpp>

static void putCentered(cv::Mat& canvas, const std::string& text, const cv::Rect& box,
                        double scale, const cv::Scalar& color, int thickness) {
    int baseline = 0;
    cv::Size size = cv::getTextSize(text, cv::FONT_HERSHEY_SIMPLEX, scale, thickness, &baseline);
    cv::Point origin(box.x + (box.width - size.width) / 2,
                     box.y + (box.height + size.height) / 2);
    cv::putText(canvas, text, origin, cv::FONT_HERSHEY_SIMPLEX, scale, color, thickness, cv::LINE_AA);
}

cv::Mat BoardRenderer::createCanvas() const {
    return cv::Mat(SCREEN_HEIGHT, SCREEN_WIDTH, CV_8UC3, BG_COLOR);
}

void BoardRenderer::render(cv::Mat& canvas, const Grid& grid, const RenderState& state) const {
    if (canvas.empty() || canvas.size() != cv::Size(SCREEN_WIDTH, SCREEN_HEIGHT)) {
        canvas = createCanvas();
    } else {
        canvas.setTo(BG_COLOR);
    }

    draw_header(canvas, state);
    if (state.paused) {
        draw_paused(canvas);
    } else {
        draw_cells(canvas, grid, state);
        draw_numbers(canvas, grid);
    }
    draw_grid(canvas);
}

std::optional<CellPos> BoardRenderer::cellFromPosition(const cv::Point& pos) {
    int boardX = pos.x - BOARD_OFFSET_X;
    int boardY = pos.y - BOARD_OFFSET_Y;

    if (boardX < 0 || boardY < 0 || boardX >= BOARD_PIXELS || boardY >= BOARD_PIXELS) {
        return std::nullopt;
    }
    return CellPos{boardY / CELL_SIZE, boardX / CELL_SIZE};
}

cv::Rect BoardRenderer::cellRect(int row, int col) {
    return cv::Rect(BOARD_OFFSET_X + col * CELL_SIZE, BOARD_OFFSET_Y + row * CELL_SIZE, CELL_SIZE, CELL_SIZE);
}

// Background colour per cell: invalid flash, then selection, then cells
// sharing the selected digit
void BoardRenderer::draw_cells(cv::Mat& canvas, const Grid& grid, const RenderState& state) const {
    int selectedValue = 0;
    if (state.selected) {
        selectedValue = grid.value(state.selected->first, state.selected->second);
    }

    for (int row = 0; row < Grid::N; ++row) {
        for (int col = 0; col < Grid::N; ++col) {
            CellPos pos{row, col};
            const cv::Scalar* color = nullptr;

            if (state.invalid && *state.invalid == pos) {
                color = &CELL_INVALID_COLOR;
            } else if (state.selected && *state.selected == pos) {
                color = &CELL_SELECTED_COLOR;
            } else if (selectedValue != 0 && grid.value(row, col) == selectedValue) {
                color = &CELL_HIGHLIGHT_COLOR;
            }

            if (color) cv::rectangle(canvas, cellRect(row, col), *color, cv::FILLED);
        }
    }
}

void BoardRenderer::draw_numbers(cv::Mat& canvas, const Grid& grid) const {
    for (int row = 0; row < Grid::N; ++row) {
        for (int col = 0; col < Grid::N; ++col) {
            Cell cell = grid.getCell(row, col);
            if (cell.value == 0) continue;

            const cv::Scalar& color = cell.isGiven ? CELL_GIVEN_COLOR : CELL_USER_COLOR;
            putCentered(canvas, std::to_string(cell.value), cellRect(row, col), FONT_SCALE_CELL, color, 2);
        }
    }
}

// Thin lines between cells, thick lines around each 3x3 box
void BoardRenderer::draw_grid(cv::Mat& canvas) const {
    for (int i = 0; i <= Grid::N; ++i) {
        int width = (i % Grid::BOX == 0) ? THICK_LINE_WIDTH : THIN_LINE_WIDTH;

        int y = BOARD_OFFSET_Y + i * CELL_SIZE;
        cv::line(canvas, {BOARD_OFFSET_X, y}, {BOARD_OFFSET_X + BOARD_PIXELS, y}, GRID_COLOR, width);

        int x = BOARD_OFFSET_X + i * CELL_SIZE;
        cv::line(canvas, {x, BOARD_OFFSET_Y}, {x, BOARD_OFFSET_Y + BOARD_PIXELS}, GRID_COLOR, width);
    }
}

void BoardRenderer::draw_header(cv::Mat& canvas, const RenderState& state) const {
    cv::putText(canvas, state.title, {TITLE_X, TITLE_Y}, cv::FONT_HERSHEY_SIMPLEX,
                FONT_SCALE_TITLE, BLACK, 2, cv::LINE_AA);
    cv::putText(canvas, "Time: " + state.timerText, {TIMER_X, TIMER_Y}, cv::FONT_HERSHEY_SIMPLEX,
                FONT_SCALE_UI, BLACK, 1, cv::LINE_AA);

    if (!state.status.empty()) {
        const cv::Scalar& color = state.won ? GREEN : BLACK;
        cv::putText(canvas, state.status, {TITLE_X, STATUS_Y}, cv::FONT_HERSHEY_SIMPLEX,
                    FONT_SCALE_BUTTON, color, 1, cv::LINE_AA);
    }
}

void BoardRenderer::draw_paused(cv::Mat& canvas) const {
    cv::Rect board(BOARD_OFFSET_X, BOARD_OFFSET_Y, BOARD_PIXELS, BOARD_PIXELS);
    cv::rectangle(canvas, board, LIGHT_GRAY, cv::FILLED);
    putCentered(canvas, "Paused", board, FONT_SCALE_TITLE * 1.5, BLACK, 2);
}
