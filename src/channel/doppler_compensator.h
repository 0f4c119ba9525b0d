#pragma once

namespace JitFhss {

/**
 * Doppler shift and propagation delay for the satellite link.
 * Range rate is in km/s, positive while the satellite closes on the ground
 * station (blue shift).
 */
class DopplerCompensator {
public:
    DopplerCompensator() = default;

    double Shift(double tx_freq, double range_rate_km_s) const;

    // Frequency observed at the receiver
    double Apply(double tx_freq, double range_rate_km_s) const;

    /**
     * Removes the shift predicted for the frequency the receiver expects.
     * Only correct when the receiver already knows which frequency was sent,
     * i.e. while pattern synchronization holds.
     */
    double Compensate(double rx_freq, double range_rate_km_s, double expected_tx_freq) const;

    double MaxShift(double freq, double max_velocity_km_s) const;

    // One-way delay in seconds for a range in km
    double PropagationDelay(double range_km) const;
    double RoundTripDelay(double range_km) const;

    void SetCompensation(bool enable) { compensation_enabled_ = enable; }
    bool compensation_enabled() const { return compensation_enabled_; }

private:
    bool compensation_enabled_ = true;
};

}  // namespace JitFhss
