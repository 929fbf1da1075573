#pragma once

#include <array>

namespace flit {

constexpr int kMaxRoundScore = 10000;
constexpr int kMaxFuelPenalty = 5000;

// Escalating per-tier hint penalties: new clue, reveal country, wayline, auto-navigate.
constexpr std::array<int, 4> kHintTierPenalties = {500, 1000, 1500, 2500};

// Sum of the first hintsUsed tiers. Counts past the table add nothing; negative counts add nothing.
int hintPenalty(int hintsUsed);

// round((1 - fuelFraction) * 5000), fuelFraction clamped to [0, 1].
int fuelPenalty(double fuelFraction);

// clamp(10000 - hintPenalty - fuelPenalty, 0, 10000)
int rawRoundScore(int hintsUsed, double fuelFraction);

// clamp(round(rawScore * difficultyMultiplier(rating)), 0, 10000)
int finalRoundScore(int rawScore, double rating);

// Clamps into [0, 1]. NaN counts as an empty tank.
double clampFuelFraction(double fuelFraction);

} // namespace flit
