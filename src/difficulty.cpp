#include "difficulty.hpp"

#include <algorithm>
#include <cctype>
#include <string>

std::string_view difficultyName(Difficulty difficulty) {
    switch (difficulty) {
        case Difficulty::Easy: return "Easy";
        case Difficulty::Medium: return "Medium";
        case Difficulty::Hard: return "Hard";
    }
    return "Easy";
}

std::optional<Difficulty> parseDifficulty(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    if (lower == "easy") return Difficulty::Easy;
    if (lower == "medium") return Difficulty::Medium;
    if (lower == "hard") return Difficulty::Hard;
    return std::nullopt;
}

// Cycles Easy -> Medium -> Hard -> Easy (difficulty button)
Difficulty nextDifficulty(Difficulty difficulty) {
    switch (difficulty) {
        case Difficulty::Easy: return Difficulty::Medium;
        case Difficulty::Medium: return Difficulty::Hard;
        case Difficulty::Hard: return Difficulty::Easy;
    }
    return Difficulty::Easy;
}
