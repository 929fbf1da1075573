#include "scoring/difficulty.hpp"
#include <algorithm>
#include <cmath>

namespace flit {

namespace {
struct Band {
    double upper;
    const char* label;
};

const Band kBands[] = {
    {0.15, "Clear Skies"},
    {0.30, "Tailwind"},
    {0.45, "Fair Weather"},
    {0.60, "Crosswinds"},
    {0.75, "Turbulence"},
    {0.90, "Storm Front"},
};

constexpr const char* kTopBandLabel = "Cat-5 Headwind";
constexpr int kBandCount = 6;
}

const char* difficultyName(GameDifficulty difficulty) {
    switch (difficulty) {
        case GameDifficulty::Easy: return "easy";
        case GameDifficulty::Normal: return "normal";
        case GameDifficulty::Hard: return "hard";
    }
    return "normal";
}

std::optional<GameDifficulty> difficultyFromName(const std::string& name) {
    if (name == "easy") return GameDifficulty::Easy;
    if (name == "normal") return GameDifficulty::Normal;
    if (name == "hard") return GameDifficulty::Hard;
    return std::nullopt;
}

std::pair<std::optional<double>, std::optional<double>> ratingRange(GameDifficulty difficulty) {
    switch (difficulty) {
        case GameDifficulty::Easy: return {std::nullopt, kEasyThreshold};
        case GameDifficulty::Hard: return {kHardMinimum, std::nullopt};
        case GameDifficulty::Normal: break;
    }
    return {std::nullopt, std::nullopt};
}

double clueTypeDifficulty(ClueType type) {
    switch (type) {
        case ClueType::Borders: return 0.10;
        case ClueType::Flag: return 0.30;
        case ClueType::Capital: return 0.50;
        case ClueType::Stats: return 0.70;
        case ClueType::Outline: return 0.90;
        default: return 0.50;
    }
}

double clampRating(double rating) {
    if (std::isnan(rating)) return kDefaultDifficultyRating;
    return std::clamp(rating, 0.0, 1.0);
}

double difficultyMultiplier(double rating) {
    return 0.5 + 0.5 * clampRating(rating);
}

double roundDifficulty(ClueType type, double rating) {
    return (clueTypeDifficulty(type) + clampRating(rating)) / 2.0;
}

int dailyDifficultyPercent(const std::vector<std::pair<ClueType, double>>& rounds) {
    if (rounds.empty()) return 50;
    double sum = 0.0;
    for (const auto& [type, rating] : rounds) {
        sum += roundDifficulty(type, rating);
    }
    long percent = std::lround(sum / static_cast<double>(rounds.size()) * 100.0);
    return static_cast<int>(std::clamp(percent, 0L, 100L));
}

const char* difficultyLabel(double fraction) {
    for (const auto& band : kBands) {
        if (fraction <= band.upper) return band.label;
    }
    return kTopBandLabel;
}

int difficultyBandIndex(double fraction) {
    for (int i = 0; i < kBandCount; ++i) {
        if (fraction <= kBands[i].upper) return i;
    }
    return kBandCount;
}

} // namespace flit
