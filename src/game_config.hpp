#pragma once

#include <cstddef>
#include <opencv2/core.hpp>

// Window / layout
constexpr int SCREEN_WIDTH = 600;
constexpr int SCREEN_HEIGHT = 700;
constexpr int FPS = 30;

constexpr int CELL_SIZE = 60;
constexpr int BOARD_OFFSET_X = 30;
constexpr int BOARD_OFFSET_Y = 100;
constexpr int BOARD_PIXELS = CELL_SIZE * 9;

constexpr int THIN_LINE_WIDTH = 1;
constexpr int THICK_LINE_WIDTH = 4;

constexpr int TITLE_X = 30;
constexpr int TITLE_Y = 45;
constexpr int TIMER_X = 430;
constexpr int TIMER_Y = 45;
constexpr int STATUS_Y = 80;

constexpr int BUTTON_Y = 655;
constexpr int BUTTON_HEIGHT = 36;
constexpr int BUTTON_WIDTH = 82;
constexpr int BUTTON_SPACING = 10;

// Font scales for cv::FONT_HERSHEY_SIMPLEX
constexpr double FONT_SCALE_CELL = 1.3;
constexpr double FONT_SCALE_UI = 0.8;
constexpr double FONT_SCALE_TITLE = 1.0;
constexpr double FONT_SCALE_BUTTON = 0.5;

// Frames an invalid-move flash stays visible
constexpr int INVALID_FLASH_FRAMES = FPS / 2;

constexpr size_t MAX_HISTORY_SIZE = 100;

constexpr const char* WINDOW_TITLE = "Sudoku Master";

// Colours are BGR
inline const cv::Scalar WHITE(255, 255, 255);
inline const cv::Scalar BLACK(0, 0, 0);
inline const cv::Scalar LIGHT_GRAY(240, 240, 240);
inline const cv::Scalar LIGHT_BLUE(255, 220, 200);
inline const cv::Scalar DARK_BLUE(255, 150, 100);
inline const cv::Scalar GREEN(60, 160, 60);

inline const cv::Scalar BG_COLOR = WHITE;
inline const cv::Scalar GRID_COLOR = BLACK;
inline const cv::Scalar CELL_GIVEN_COLOR(50, 50, 50);
inline const cv::Scalar CELL_USER_COLOR(200, 100, 0);
inline const cv::Scalar CELL_INVALID_COLOR(50, 50, 255);
inline const cv::Scalar CELL_SELECTED_COLOR(150, 255, 255);
inline const cv::Scalar CELL_HIGHLIGHT_COLOR(255, 240, 220);
