#pragma once

#include <chrono>
#include <functional>
#include <string>

// Wall-clock play timer. Paused intervals are not counted.
class GameTimer {
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;

    GameTimer();
    explicit GameTimer(NowFn now);

    void start();
    void stop();
    void pause();
    void resume();

    double elapsedSeconds() const;
    std::string formatted() const;

    bool isRunning() const { return running; }
    bool isPaused() const { return paused; }

    // "MM:SS"; minutes are not wrapped at 60
    static std::string format(double seconds);

private:
    NowFn now;
    Clock::time_point start_time;
    Clock::time_point pause_start;
    bool running = false;
    bool paused = false;
};
