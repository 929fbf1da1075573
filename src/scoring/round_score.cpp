#include "scoring/round_score.hpp"
#include "scoring/difficulty.hpp"
#include <algorithm>
#include <cmath>

namespace flit {

int hintPenalty(int hintsUsed) {
    int penalty = 0;
    for (int i = 0; i < hintsUsed && i < static_cast<int>(kHintTierPenalties.size()); ++i) {
        penalty += kHintTierPenalties[static_cast<std::size_t>(i)];
    }
    return penalty;
}

double clampFuelFraction(double fuelFraction) {
    if (std::isnan(fuelFraction)) return 0.0;
    return std::clamp(fuelFraction, 0.0, 1.0);
}

int fuelPenalty(double fuelFraction) {
    double burned = 1.0 - clampFuelFraction(fuelFraction);
    return static_cast<int>(std::lround(burned * kMaxFuelPenalty));
}

int rawRoundScore(int hintsUsed, double fuelFraction) {
    int raw = kMaxRoundScore - hintPenalty(hintsUsed) - fuelPenalty(fuelFraction);
    return std::clamp(raw, 0, kMaxRoundScore);
}

int finalRoundScore(int rawScore, double rating) {
    if (rawScore <= 0) return 0;
    long scaled = std::lround(static_cast<double>(rawScore) * difficultyMultiplier(rating));
    return static_cast<int>(std::clamp(scaled, 0L, static_cast<long>(kMaxRoundScore)));
}

} // namespace flit
