#include "button.hpp"
#include "game_config.hpp"

#include <opencv2/highgui.hpp>
#include <opencv2/imgproc.hpp>

Button::Button(const cv::Rect& rect, std::string text, std::function<void()> callback)
    : area(rect), label(std::move(text)), on_click(std::move(callback)) {}

void Button::render(cv::Mat& canvas) const {
    cv::Scalar color = LIGHT_GRAY;
    if (pressed) {
        color = DARK_BLUE;
    } else if (hovered) {
        color = LIGHT_BLUE;
    }

    cv::rectangle(canvas, area, color, cv::FILLED);
    cv::rectangle(canvas, area, BLACK, 2);

    // Center the label inside the rectangle
    int baseline = 0;
    cv::Size textSize = cv::getTextSize(label, cv::FONT_HERSHEY_SIMPLEX, FONT_SCALE_BUTTON, 1, &baseline);
    cv::Point origin(area.x + (area.width - textSize.width) / 2,
                     area.y + (area.height + textSize.height) / 2);
    cv::putText(canvas, label, origin, cv::FONT_HERSHEY_SIMPLEX, FONT_SCALE_BUTTON, BLACK, 1, cv::LINE_AA);
}

bool Button::handleMouse(int event, int x, int y) {
    bool inside = area.contains(cv::Point(x, y));

    switch (event) {
        case cv::EVENT_MOUSEMOVE:
            hovered = inside;
            break;
        case cv::EVENT_LBUTTONDOWN:
            if (inside) pressed = true;
            break;
        case cv::EVENT_LBUTTONUP: {
            bool clicked = pressed && inside;
            pressed = false;
            if (clicked) {
                if (on_click) on_click();
                return true;
            }
            break;
        }
        default:
            break;
    }
    return false;
}
