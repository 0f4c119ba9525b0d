#pragma once

#include <cstdint>

namespace JitFhss {

/// Propagation speed used by the Doppler and delay calculations (m/s)
inline constexpr double kSpeedOfLight = 2.998e8;
/// Exact value used by the link budget's wavelength (m/s)
inline constexpr double kSpeedOfLightExact = 299792458.0;
/// Boltzmann constant (dBW/K/Hz)
inline constexpr double kBoltzmannDbw = -228.6;

inline constexpr double kEarthRadiusKm = 6371.0;
/// Earth's gravitational parameter (km^3/s^2)
inline constexpr double kEarthMu = 398600.0;
/// Sidereal rotation rate (rad/s)
inline constexpr double kEarthRotationRate = 7.2921159e-5;

/// Fallback cache seed. Every source must use the same one.
inline constexpr uint64_t kFallbackCacheSeed = 12345;

/// Decode gating defaults
inline constexpr double kDefaultSnrThresholdDb = 8.0;
inline constexpr double kClockToleranceFraction = 0.1;
inline constexpr double kFrequencyToleranceFraction = 0.01;
/// Hop edges closer than this fraction of the hop duration count as simultaneous
inline constexpr double kHopEdgeToleranceFraction = 1e-3;

/// Ground segment delivery delay for patterns (s)
inline constexpr double kGroundDeliveryDelay = 0.001;

}  // namespace JitFhss
