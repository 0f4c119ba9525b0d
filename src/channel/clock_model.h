#pragma once

#include <string>

#include "common/random_source.h"

namespace JitFhss {

/**
 * RMS magnitudes of the quadratic drift coefficients for one oscillator class
 */
struct ClockGrade {
    std::string name;
    double bias_sigma = 0.0;   // s
    double drift_sigma = 0.0;  // s/s
    double aging_sigma = 0.0;  // s/s^2

    // Space-qualified rubidium/cesium
    static ClockGrade Satellite() { return {"satellite", 1e-6, 1e-11, 1e-14}; }
    // GPS-disciplined ground reference
    static ClockGrade Ground() { return {"ground", 5e-7, 5e-12, 5e-15}; }
    static ClockGrade Ideal() { return {"ideal", 0.0, 0.0, 0.0}; }
};

/**
 * Quadratic clock error model:
 *   error(t) = bias + drift*(t - epoch) + 0.5*aging*(t - epoch)^2
 * Coefficients are drawn once at construction.
 */
class ClockModel {
public:
    ClockModel(const ClockGrade& grade, RandomSource& random);

    // Explicit coefficients, mostly for tests
    ClockModel(double bias, double drift, double aging, double epoch = 0.0);

    double Error(double t) const;
    double DriftRate(double t) const;

    // Moves the reference epoch to t; the current error becomes the bias
    void Reset(double t);

    // Applies an external time correction at t (e.g. a GNSS fix)
    void Sync(double t, double correction);

    double bias() const { return bias_; }
    double drift() const { return drift_; }
    double aging() const { return aging_; }
    double epoch() const { return epoch_; }
    const std::string& grade_name() const { return grade_name_; }

private:
    std::string grade_name_;
    double bias_;
    double drift_;
    double aging_;
    double epoch_ = 0.0;
};

}  // namespace JitFhss
