#pragma once

#include "math/vec2.hpp"
#include <vector>

namespace flit {

class Rng;

/**
 * @brief Longitude/latitude box, in degrees.
 */
struct GeoBounds {
    double minLng = -180.0;
    double minLat = -85.0;
    double maxLng = 180.0;
    double maxLat = 85.0;

    Vec2 center() const { return Vec2((minLng + maxLng) * 0.5, (minLat + maxLat) * 0.5); }
    bool contains(const Vec2& p) const;

    // One longitude draw then one latitude draw, in that order.
    Vec2 sample(Rng& rng) const;
};

// Arithmetic mean of the points. Returns (0, 0) for an empty set.
Vec2 centroid(const std::vector<Vec2>& points);

// Haversine angular distance between two lng/lat points, in degrees.
double greatCircleDistanceDeg(const Vec2& a, const Vec2& b);

} // namespace flit
