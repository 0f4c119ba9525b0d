#pragma once

#include "orbit_kinematics.h"

namespace JitFhss {

struct OrbitOptions {
    double altitude_km = 500.0;
    double inclination_deg = 45.0;
    double ground_lat_deg = 22.0;
    double ground_lon_deg = 21.5;
};

/**
 * Circular Keplerian orbit over a spherical, rotating Earth. The satellite
 * starts at the ascending node at t = 0 with the node on the Greenwich
 * meridian.
 */
class CircularOrbit : public OrbitKinematics {
public:
    explicit CircularOrbit(const OrbitOptions& options);

    OrbitSample Sample(double t) const override;

    double period() const { return period_; }
    // Circular orbital speed in km/s
    double orbital_velocity() const;

    const OrbitOptions& options() const { return options_; }

private:
    void GroundStation(double t, Vec3& position, Vec3& velocity) const;

    OrbitOptions options_;
    double radius_;
    double period_;
};

}  // namespace JitFhss
