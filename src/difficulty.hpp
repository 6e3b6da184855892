#pragma once

#include <optional>
#include <string_view>

enum class Difficulty {
    Easy,
    Medium,
    Hard
};

// Cells carved out of a solved grid: Easy leaves 41 clues, Medium 30, Hard 25.
constexpr int cellsToRemove(Difficulty difficulty) {
    switch (difficulty) {
        case Difficulty::Easy: return 40;
        case Difficulty::Medium: return 51;
        case Difficulty::Hard: return 56;
    }
    return 40;
}

std::string_view difficultyName(Difficulty difficulty);
std::optional<Difficulty> parseDifficulty(std::string_view text);
Difficulty nextDifficulty(Difficulty difficulty);
