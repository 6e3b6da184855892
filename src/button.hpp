#pragma once

#include <functional>
#include <string>
#include <utility>
#include <opencv2/core.hpp>

class Button {
public:
    Button(const cv::Rect& rect, std::string text, std::function<void()> callback = nullptr);

    void render(cv::Mat& canvas) const;

    // Feed an OpenCV mouse event (cv::EVENT_*). Returns true when the button
    // was clicked, i.e. pressed and released inside its rectangle.
    bool handleMouse(int event, int x, int y);

    void setText(const std::string& text) { label = text; }
    void setCallback(std::function<void()> callback) { on_click = std::move(callback); }

    const cv::Rect& rect() const { return area; }
    const std::string& text() const { return label; }
    bool isHovered() const { return hovered; }
    bool isPressed() const { return pressed; }

private:
    cv::Rect area;
    std::string label;
    std::function<void()> on_click;
    bool hovered = false;
    bool pressed = false;
};
