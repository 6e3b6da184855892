#include "game_timer.hpp"

#include <cstdio>
#include <utility>

GameTimer::GameTimer() : GameTimer([] { return Clock::now(); }) {}

GameTimer::GameTimer(NowFn now) : now(std::move(now)) {}

void GameTimer::start() {
    start_time = now();
    running = true;
    paused = false;
}

void GameTimer::stop() {
    running = false;
    paused = false;
}

void GameTimer::pause() {
    if (running && !paused) {
        paused = true;
        pause_start = now();
    }
}

void GameTimer::resume() {
    if (running && paused) {
        // Shift the start forward by the paused duration
        start_time += now() - pause_start;
        paused = false;
    }
}

double GameTimer::elapsedSeconds() const {
    if (!running) return 0.0;

    Clock::time_point end = paused ? pause_start : now();
    std::chrono::duration<double> elapsed = end - start_time;
    return elapsed.count();
}

std::string GameTimer::formatted() const {
    return format(elapsedSeconds());
}

std::string GameTimer::format(double seconds) {
    if (seconds < 0) seconds = 0;
    long total = static_cast<long>(seconds);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02ld:%02ld", total / 60, total % 60);
    return buf;
}
