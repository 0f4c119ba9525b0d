#include "doppler_compensator.h"

#include <cmath>

#include "common/config.h"

namespace JitFhss {

double DopplerCompensator::Shift(double tx_freq, double range_rate_km_s) const {
    return tx_freq * (range_rate_km_s * 1000.0 / kSpeedOfLight);
}

double DopplerCompensator::Apply(double tx_freq, double range_rate_km_s) const {
    return tx_freq + Shift(tx_freq, range_rate_km_s);
}

double DopplerCompensator::Compensate(double rx_freq, double range_rate_km_s,
                                      double expected_tx_freq) const {
    if (!compensation_enabled_) {
        return rx_freq;
    }
    return rx_freq - Shift(expected_tx_freq, range_rate_km_s);
}

double DopplerCompensator::MaxShift(double freq, double max_velocity_km_s) const {
    return std::fabs(Shift(freq, max_velocity_km_s));
}

double DopplerCompensator::PropagationDelay(double range_km) const {
    return range_km * 1000.0 / kSpeedOfLight;
}

double DopplerCompensator::RoundTripDelay(double range_km) const {
    return 2.0 * PropagationDelay(range_km);
}

}  // namespace JitFhss
