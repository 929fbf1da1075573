#include <doctest/doctest.h>

#include "scoring/difficulty.hpp"
#include "scoring/round_score.hpp"

#include <cmath>
#include <limits>

using namespace flit;

TEST_CASE("Hint penalty escalates per tier") {
    CHECK(hintPenalty(0) == 0);
    CHECK(hintPenalty(1) == 500);
    CHECK(hintPenalty(2) == 1500);
    CHECK(hintPenalty(3) == 3000);
    CHECK(hintPenalty(4) == 5500);
}

TEST_CASE("Hint counts outside the table add no further penalty") {
    CHECK(hintPenalty(5) == 5500);
    CHECK(hintPenalty(50) == 5500);
    CHECK(hintPenalty(-3) == 0);
}

TEST_CASE("Fuel penalty scales with fuel burned") {
    CHECK(fuelPenalty(1.0) == 0);
    CHECK(fuelPenalty(0.0) == 5000);
    CHECK(fuelPenalty(0.5) == 2500);
    CHECK(fuelPenalty(0.75) == 1250);
}

TEST_CASE("Fuel fraction is clamped rather than rejected") {
    CHECK(clampFuelFraction(1.4) == 1.0);
    CHECK(clampFuelFraction(-0.2) == 0.0);
    CHECK(clampFuelFraction(std::numeric_limits<double>::quiet_NaN()) == 0.0);
    CHECK(fuelPenalty(1.0000001) == 0);
    CHECK(fuelPenalty(-1.0) == 5000);
}

TEST_CASE("Full fuel, no hints, hardest target scores the maximum") {
    int raw = rawRoundScore(0, 1.0);
    CHECK(raw == 10000);
    CHECK(difficultyMultiplier(1.0) == doctest::Approx(1.0));
    CHECK(finalRoundScore(raw, 1.0) == 10000);
}

TEST_CASE("All hints on the easiest target halves a 4500 raw score") {
    int raw = rawRoundScore(4, 1.0);
    CHECK(raw == 4500);
    CHECK(difficultyMultiplier(0.0) == doctest::Approx(0.5));
    CHECK(finalRoundScore(raw, 0.0) == 2250);
}

TEST_CASE("Empty tank at rating 0.6 scores 4000") {
    int raw = rawRoundScore(0, 0.0);
    CHECK(raw == 5000);
    CHECK(difficultyMultiplier(0.6) == doctest::Approx(0.8));
    CHECK(finalRoundScore(raw, 0.6) == 4000);
}

TEST_CASE("NaN rating scores like an unrated target") {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    CHECK(finalRoundScore(10000, nan) == 7750);
    CHECK(finalRoundScore(4500, nan) == finalRoundScore(4500, kDefaultDifficultyRating));
}

TEST_CASE("Raw score never drops below zero") {
    CHECK(rawRoundScore(4, 0.0) == 0);
    CHECK(finalRoundScore(0, 1.0) == 0);
}

TEST_CASE("Scores stay within bounds and are monotonic in hints and fuel") {
    for (double rating = 0.0; rating <= 1.0; rating += 0.25) {
        for (int fuelStep = 0; fuelStep <= 10; ++fuelStep) {
            double fuel = fuelStep / 10.0;
            int previous = std::numeric_limits<int>::max();
            for (int hints = 0; hints <= 4; ++hints) {
                int score = finalRoundScore(rawRoundScore(hints, fuel), rating);
                CHECK(score >= 0);
                CHECK(score <= kMaxRoundScore);
                CHECK(score <= previous);
                previous = score;
            }
        }
        for (int hints = 0; hints <= 4; ++hints) {
            int previous = std::numeric_limits<int>::max();
            for (int fuelStep = 10; fuelStep >= 0; --fuelStep) {
                int score = finalRoundScore(rawRoundScore(hints, fuelStep / 10.0), rating);
                CHECK(score <= previous);
                previous = score;
            }
        }
    }
}
