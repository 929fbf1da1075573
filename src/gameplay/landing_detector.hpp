#pragma once

#include "math/vec2.hpp"

namespace flit {

enum class LandingProximity {
    Far,
    Approaching,
    Near,
    Landing  // within the landing threshold and at low altitude
};

struct LandingThresholds {
    double landingDeg = 8.0;
    double nearDeg = 15.0;
    double approachingDeg = 30.0;
};

/**
 * @brief Decides whether the plane has reached the round's target.
 *
 * Positions are lng/lat in degrees; distance is great-circle angular distance.
 */
class LandingDetector {
public:
    explicit LandingDetector(const LandingThresholds& thresholds = {});

    bool checkLanding(const Vec2& plane, const Vec2& target, bool lowAltitude) const;
    LandingProximity proximity(const Vec2& plane, const Vec2& target, bool lowAltitude = false) const;

    const LandingThresholds& thresholds() const { return m_thresholds; }

private:
    LandingThresholds m_thresholds;
};

const char* proximityName(LandingProximity proximity);

} // namespace flit
