#include <doctest/doctest.h>

#include "math/geo.hpp"
#include "math/rng.hpp"

#include <stdexcept>

using namespace flit;

TEST_CASE("Same seed gives the same sequence") {
    Rng a(42);
    Rng b(42);
    for (int i = 0; i < 100; ++i) {
        CHECK(a.nextU64() == b.nextU64());
    }

    Rng c(43);
    Rng d(42);
    bool differs = false;
    for (int i = 0; i < 8; ++i) {
        if (c.nextU64() != d.nextU64()) differs = true;
    }
    CHECK(differs);
}

TEST_CASE("Bounded draws stay in range") {
    Rng rng(7);
    for (int i = 0; i < 1000; ++i) {
        double d = rng.nextDouble();
        CHECK(d >= 0.0);
        CHECK(d < 1.0);
        int n = rng.nextInt(5);
        CHECK(n >= 0);
        CHECK(n < 5);
    }
    CHECK(rng.nextInt(1) == 0);
    CHECK_THROWS_AS(rng.nextInt(0), std::invalid_argument);
}

TEST_CASE("Bounds sample longitude then latitude") {
    GeoBounds bounds{-180.0, -70.0, 180.0, 70.0};
    Rng rng(123);
    Rng replay(123);

    Vec2 p = bounds.sample(rng);
    double lng = replay.nextDouble() * 360.0 - 180.0;
    double lat = replay.nextDouble() * 140.0 - 70.0;
    CHECK(p.x == lng);
    CHECK(p.y == lat);
    CHECK(bounds.contains(p));
    CHECK_FALSE(bounds.contains(Vec2(0.0, 75.0)));
}

TEST_CASE("Centroid is the mean of the points") {
    Vec2 c = centroid({Vec2(0.0, 0.0), Vec2(4.0, 0.0), Vec2(4.0, 2.0), Vec2(0.0, 2.0)});
    CHECK(c.x == doctest::Approx(2.0));
    CHECK(c.y == doctest::Approx(1.0));
    CHECK(centroid({}) == Vec2(0.0, 0.0));
}

TEST_CASE("Great-circle distance") {
    CHECK(greatCircleDistanceDeg(Vec2(0.0, 0.0), Vec2(0.0, 0.0)) == doctest::Approx(0.0));
    CHECK(greatCircleDistanceDeg(Vec2(0.0, 0.0), Vec2(90.0, 0.0)) == doctest::Approx(90.0));
    CHECK(greatCircleDistanceDeg(Vec2(0.0, -90.0), Vec2(0.0, 90.0)) == doctest::Approx(180.0));
}
