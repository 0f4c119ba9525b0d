#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>

#include "channel/channel_quality.h"
#include "channel/clock_model.h"
#include "orbit/circular_orbit.h"
#include "orbit/orbit_kinematics.h"
#include "participant/hop_timer.h"
#include "participant/receiver.h"
#include "participant/sender.h"
#include "pattern/pattern_distributor.h"
#include "pattern/pattern_source.h"

namespace JitFhss {

struct SimulationOptions {
    double duration = 1000.0;       // s
    double time_step = 0.1;         // s
    double min_elevation_deg = 5.0;
    uint64_t seed = 0;              // 0 = nondeterministic

    // Buffer refill policy
    int refill_interval = 10;       // ticks
    double refill_fraction = 0.3;   // of buffer capacity
    int refill_count = 10;

    // Administrative jamming window
    bool jam_enabled = true;
    int jam_channel = 1;
    double jam_start = 400.0;
    double jam_duration = 200.0;

    double resync_interval = 0.0;   // s, 0 disables
    bool doppler_compensation = true;

    PatternSourceOptions source;
    ParticipantOptions participant;
    OrbitOptions orbit;
    LinkBudgetOptions link;
    ClockGrade sender_clock = ClockGrade::Satellite();
    ClockGrade receiver_clock = ClockGrade::Ground();
};

struct SimulationStats {
    uint64_t ticks = 0;
    uint64_t visible_ticks = 0;
    uint64_t transmissions = 0;
    uint64_t successes = 0;
    uint64_t low_snr_failures = 0;
    uint64_t clock_drift_failures = 0;
    uint64_t frequency_mismatch_failures = 0;
    uint64_t refills = 0;
    uint64_t resyncs = 0;
    uint64_t cached_patterns = 0;
    uint64_t failovers = 0;
    uint64_t exhaustions = 0;

    uint64_t failures() const {
        return low_snr_failures + clock_drift_failures + frequency_mismatch_failures;
    }
    double success_rate() const {
        return transmissions == 0 ? 0.0 : static_cast<double>(successes) / static_cast<double>(transmissions);
    }
};

/**
 * Discrete-time driver wiring one satellite sender and one ground receiver to
 * a shared PatternSource. Each tick applies the jamming window, refills both
 * buffers when they run low, and exchanges one symbol while the satellite is
 * above the elevation mask.
 *
 * @threading Single-threaded.
 */
class LinkSimulation {
public:
    explicit LinkSimulation(const SimulationOptions& options,
                            std::shared_ptr<const OrbitKinematics> orbit = nullptr,
                            std::shared_ptr<RandomSource> random = nullptr);

    LinkSimulation(const LinkSimulation&) = delete;
    LinkSimulation& operator=(const LinkSimulation&) = delete;

    // Fills both buffers to capacity at t = 0
    void Preload();

    // Preloads and runs every tick up to duration
    const SimulationStats& Run();

    // One tick at t = tick * time_step
    void Step(uint64_t tick);

    uint64_t NumTicks() const;

    const SimulationStats& stats() const { return stats_; }
    const SimulationOptions& options() const { return options_; }

    PatternSource& Source() { return source_; }
    Sender& Satellite() { return sender_; }
    Receiver& Ground() { return receiver_; }
    ChannelQualityModel& Channel() { return *channel_; }
    const PatternDistributor& Distributor() const { return distributor_; }

    void LogSummary() const;

private:
    void ApplyJamming(double t);
    void MaybeRefill(uint64_t tick, double t);
    void MaybeResync(double t);
    void Exchange(double t);
    void Collect();

    const SimulationOptions options_;
    std::shared_ptr<RandomSource> random_;
    std::shared_ptr<const OrbitKinematics> orbit_;
    std::shared_ptr<ChannelQualityModel> channel_;
    PatternSource source_;
    Sender sender_;
    Receiver receiver_;
    PatternDistributor distributor_;

    SimulationStats stats_;
    bool jam_active_ = false;
    double last_resync_ = 0.0;
};

}  // namespace JitFhss
