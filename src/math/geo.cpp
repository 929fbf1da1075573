#include "math/geo.hpp"
#include "math/rng.hpp"
#include <algorithm>
#include <cmath>

namespace flit {

namespace {
constexpr double kDegToRad = 3.141592653589793 / 180.0;
constexpr double kRadToDeg = 180.0 / 3.141592653589793;
}

bool GeoBounds::contains(const Vec2& p) const {
    return p.x >= minLng && p.x <= maxLng && p.y >= minLat && p.y <= maxLat;
}

Vec2 GeoBounds::sample(Rng& rng) const {
    double lng = minLng + rng.nextDouble() * (maxLng - minLng);
    double lat = minLat + rng.nextDouble() * (maxLat - minLat);
    return Vec2(lng, lat);
}

Vec2 centroid(const std::vector<Vec2>& points) {
    if (points.empty()) {
        return Vec2();
    }
    double sumX = 0.0;
    double sumY = 0.0;
    for (const auto& p : points) {
        sumX += p.x;
        sumY += p.y;
    }
    const double n = static_cast<double>(points.size());
    return Vec2(sumX / n, sumY / n);
}

double greatCircleDistanceDeg(const Vec2& a, const Vec2& b) {
    double lat1 = a.y * kDegToRad;
    double lat2 = b.y * kDegToRad;
    double dLat = (b.y - a.y) * kDegToRad;
    double dLng = (b.x - a.x) * kDegToRad;

    double h = std::sin(dLat / 2) * std::sin(dLat / 2) +
               std::cos(lat1) * std::cos(lat2) * std::sin(dLng / 2) * std::sin(dLng / 2);
    h = std::min(1.0, std::max(0.0, h));
    double c = 2.0 * std::atan2(std::sqrt(h), std::sqrt(1.0 - h));

    return c * kRadToDeg;
}

} // namespace flit
