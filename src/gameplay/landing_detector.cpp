#include "gameplay/landing_detector.hpp"
#include "math/geo.hpp"

namespace flit {

LandingDetector::LandingDetector(const LandingThresholds& thresholds)
    : m_thresholds(thresholds)
{
}

bool LandingDetector::checkLanding(const Vec2& plane, const Vec2& target, bool lowAltitude) const {
    if (!lowAltitude) return false;
    return greatCircleDistanceDeg(plane, target) <= m_thresholds.landingDeg;
}

LandingProximity LandingDetector::proximity(const Vec2& plane, const Vec2& target, bool lowAltitude) const {
    double distance = greatCircleDistanceDeg(plane, target);

    if (distance <= m_thresholds.landingDeg && lowAltitude) {
        return LandingProximity::Landing;
    }
    if (distance <= m_thresholds.nearDeg) {
        return LandingProximity::Near;
    }
    if (distance <= m_thresholds.approachingDeg) {
        return LandingProximity::Approaching;
    }
    return LandingProximity::Far;
}

const char* proximityName(LandingProximity proximity) {
    switch (proximity) {
        case LandingProximity::Far: return "far";
        case LandingProximity::Approaching: return "approaching";
        case LandingProximity::Near: return "near";
        case LandingProximity::Landing: return "landing";
    }
    return "far";
}

}
