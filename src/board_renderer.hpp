#pragma once

#include <optional>
#include <string>
#include <utility>
#include <opencv2/core.hpp>

#include "grid.hpp"

using CellPos = std::pair<int, int>; // (row, col)

struct RenderState {
    std::optional<CellPos> selected;
    std::optional<CellPos> invalid;
    std::string title;
    std::string timerText = "00:00";
    std::string status;
    bool paused = false;
    bool won = false;
};

// Draws the board and header onto a BGR canvas. Holds no game state.
class BoardRenderer {
public:
    cv::Mat createCanvas() const;
    void render(cv::Mat& canvas, const Grid& grid, const RenderState& state) const;

    static std::optional<CellPos> cellFromPosition(const cv::Point& pos);
    static cv::Rect cellRect(int row, int col);

private:
    void draw_cells(cv::Mat& canvas, const Grid& grid, const RenderState& state) const;
    void draw_numbers(cv::Mat& canvas, const Grid& grid) const;
    void draw_grid(cv::Mat& canvas) const;
    void draw_header(cv::Mat& canvas, const RenderState& state) const;
    void draw_paused(cv::Mat& canvas) const;
};
