#include "circular_orbit.h"

#include <cmath>

#include <glog/logging.h>
#include "common/config.h"

namespace JitFhss {

namespace {

constexpr double kPi = 3.14159265358979323846;

double Deg2Rad(double deg) { return deg * kPi / 180.0; }
double Rad2Deg(double rad) { return rad * 180.0 / kPi; }

double Dot(const Vec3& a, const Vec3& b) {
    return a[0] * b[0] + a[1] * b[1] + a[2] * b[2];
}

double Norm(const Vec3& a) { return std::sqrt(Dot(a, a)); }

}  // namespace

CircularOrbit::CircularOrbit(const OrbitOptions& options)
    : options_(options),
      radius_(kEarthRadiusKm + options.altitude_km),
      period_(2.0 * kPi * std::sqrt(radius_ * radius_ * radius_ / kEarthMu)) {
    VLOG(1) << "CircularOrbit: altitude " << options_.altitude_km << " km, period "
            << period_ / 60.0 << " min, speed " << orbital_velocity() << " km/s";
}

double CircularOrbit::orbital_velocity() const {
    return std::sqrt(kEarthMu / radius_);
}

void CircularOrbit::GroundStation(double t, Vec3& position, Vec3& velocity) const {
    const double lat = Deg2Rad(options_.ground_lat_deg);
    const double lon = Deg2Rad(options_.ground_lon_deg) + kEarthRotationRate * t;
    position = {kEarthRadiusKm * std::cos(lat) * std::cos(lon),
                kEarthRadiusKm * std::cos(lat) * std::sin(lon),
                kEarthRadiusKm * std::sin(lat)};
    // omega x r, omega along +z
    velocity = {-kEarthRotationRate * position[1], kEarthRotationRate * position[0], 0.0};
}

OrbitSample CircularOrbit::Sample(double t) const {
    OrbitSample s;

    const double omega = 2.0 * kPi / period_;
    const double theta = omega * t;
    const double v = orbital_velocity();
    const double inc = Deg2Rad(options_.inclination_deg);

    const double x = radius_ * std::cos(theta);
    const double y = radius_ * std::sin(theta);
    s.position = {x, y * std::cos(inc), y * std::sin(inc)};

    const double vx = -v * std::sin(theta);
    const double vy = v * std::cos(theta);
    s.velocity = {vx, vy * std::cos(inc), vy * std::sin(inc)};

    Vec3 gs_pos, gs_vel;
    GroundStation(t, gs_pos, gs_vel);

    const Vec3 rho = {s.position[0] - gs_pos[0], s.position[1] - gs_pos[1], s.position[2] - gs_pos[2]};
    const Vec3 rel_vel = {s.velocity[0] - gs_vel[0], s.velocity[1] - gs_vel[1], s.velocity[2] - gs_vel[2]};

    s.range_km = Norm(rho);
    // Negated d(range)/dt: positive while closing
    s.range_rate_km_s = -Dot(rho, rel_vel) / s.range_km;

    const double up_component = Dot(rho, gs_pos) / Norm(gs_pos);
    s.elevation_deg = Rad2Deg(std::asin(up_component / s.range_km));
    return s;
}

}  // namespace JitFhss
