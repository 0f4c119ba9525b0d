#pragma once

#include <memory>

#include "clock_model.h"
#include "common/random_source.h"

namespace JitFhss {

struct LinkBudgetOptions {
    double carrier_frequency = 2.05e9; // Hz
    double tx_power_dbw = 10.0;
    double tx_gain_dbi = 15.0;
    double rx_gain_dbi = 25.0;
    double system_temp_k = 290.0;
    double bandwidth_hz = 1.0e6;
};

/**
 * Every term of one SNR evaluation, in dB / dBW
 */
struct SnrBreakdown {
    double fspl_db = 0.0;
    double atmospheric_db = 0.0;
    double ionospheric_db = 0.0;
    double rain_db = 0.0;
    double eirp_dbw = 0.0;
    double rx_power_dbw = 0.0;
    double noise_power_dbw = 0.0;
    double snr_db = 0.0;
};

/**
 * ChannelQualityModel evaluates the satellite-to-ground link at one instant:
 * SNR from a link budget with freshly sampled atmospheric, ionospheric and
 * rain impairments, and the receiver's timing error against the sender.
 *
 * The sender and receiver clocks are independent instances with their own
 * oscillator grades.
 */
class ChannelQualityModel {
public:
    ChannelQualityModel(const LinkBudgetOptions& options,
                        std::shared_ptr<RandomSource> random,
                        const ClockGrade& sender_grade = ClockGrade::Satellite(),
                        const ClockGrade& receiver_grade = ClockGrade::Ground());

    /**
     * @param range_km Slant range
     * @param elevation_deg Elevation seen from the ground station
     */
    SnrBreakdown Snr(double range_km, double elevation_deg);

    double SnrDb(double range_km, double elevation_deg) { return Snr(range_km, elevation_deg).snr_db; }

    // Receiver clock error relative to the sender's, in seconds
    double ClockError(double t) const;

    // Synchronization event: both clocks restart their drift from t
    void Resync(double t);

    double FreeSpacePathLoss(double range_km) const;
    double NoisePower() const;

    // Impairment terms; each call draws new perturbations
    double AtmosphericLoss(double elevation_deg);
    double IonosphericLoss(double elevation_deg);
    double RainFade(double elevation_deg);

    ClockModel& sender_clock() { return sender_clock_; }
    ClockModel& receiver_clock() { return receiver_clock_; }
    const LinkBudgetOptions& options() const { return options_; }

private:
    LinkBudgetOptions options_;
    std::shared_ptr<RandomSource> random_;
    ClockModel sender_clock_;
    ClockModel receiver_clock_;
};

}  // namespace JitFhss
