#pragma once

#include <array>

namespace JitFhss {

using Vec3 = std::array<double, 3>;

/**
 * Satellite state as seen from the ground station at one instant
 */
struct OrbitSample {
    Vec3 position{};          // km, ECI
    Vec3 velocity{};          // km/s, ECI
    double range_km = 0.0;
    double range_rate_km_s = 0.0; // positive while closing
    double elevation_deg = 0.0;
};

/**
 * Pure function of time describing the satellite/ground-station geometry
 */
class OrbitKinematics {
public:
    virtual ~OrbitKinematics() = default;

    virtual OrbitSample Sample(double t) const = 0;

    bool IsVisible(double t, double min_elevation_deg) const {
        return Sample(t).elevation_deg >= min_elevation_deg;
    }
};

}  // namespace JitFhss
