#include "link_simulation.h"

#include <cmath>

#include <glog/logging.h>
#include "common/config.h"

namespace JitFhss {

namespace {

std::shared_ptr<RandomSource> OrDefaultRandom(std::shared_ptr<RandomSource> random, uint64_t seed) {
    return random ? std::move(random) : MakeRandomSource(seed);
}

std::shared_ptr<const OrbitKinematics> OrDefaultOrbit(std::shared_ptr<const OrbitKinematics> orbit,
                                                      const OrbitOptions& options) {
    if (orbit) {
        return orbit;
    }
    return std::make_shared<CircularOrbit>(options);
}

} // namespace

LinkSimulation::LinkSimulation(const SimulationOptions& options,
                               std::shared_ptr<const OrbitKinematics> orbit,
                               std::shared_ptr<RandomSource> random)
    : options_(options),
      random_(OrDefaultRandom(std::move(random), options.seed)),
      orbit_(OrDefaultOrbit(std::move(orbit), options.orbit)),
      channel_(std::make_shared<ChannelQualityModel>(options.link, random_,
                                                     options.sender_clock, options.receiver_clock)),
      source_(options.source, random_),
      sender_(options.participant, orbit_),
      receiver_(options.participant, orbit_, channel_),
      distributor_(source_) {
    CHECK_GT(options_.time_step, 0.0) << "time_step must be positive";
    CHECK_GE(options_.refill_interval, 1) << "refill_interval must be at least one tick";

    receiver_.Doppler().SetCompensation(options_.doppler_compensation);

    distributor_.AddDestination("satellite", sender_.Buffer(), [this]() { return sender_.DeliveryDelay(); });
    distributor_.AddDestination("ground", receiver_.Buffer(), kGroundDeliveryDelay);

    receiver_.Buffer().SetLowBufferCallback([this](size_t remaining) {
        LOG_EVERY_N(WARNING, 100) << "Ground buffer low at t=" << receiver_.current_time()
                                  << " (" << remaining << " remaining)";
    });
}

uint64_t LinkSimulation::NumTicks() const {
    return static_cast<uint64_t>(std::floor(options_.duration / options_.time_step + 1e-9)) + 1;
}

void LinkSimulation::Preload() {
    sender_.SetTime(0.0);
    receiver_.SetTime(0.0);
    const size_t capacity = options_.participant.buffer_capacity;
    const size_t accepted = distributor_.Distribute(capacity, 0.0);
    VLOG(1) << "Preloaded " << accepted << " of " << capacity << " pattern(s)";
}

const SimulationStats& LinkSimulation::Run() {
    Preload();
    const uint64_t ticks = NumTicks();
    LOG(INFO) << "Running " << ticks << " tick(s) of " << options_.time_step << " s, hop every "
              << options_.participant.hop_duration << " s";
    for (uint64_t tick = 0; tick < ticks; ++tick) {
        Step(tick);
    }
    return stats_;
}

void LinkSimulation::Step(uint64_t tick) {
    const double t = static_cast<double>(tick) * options_.time_step;
    sender_.SetTime(t);
    receiver_.SetTime(t);

    ApplyJamming(t);
    MaybeRefill(tick, t);
    MaybeResync(t);

    ++stats_.ticks;
    if (orbit_->IsVisible(t, options_.min_elevation_deg)) {
        ++stats_.visible_ticks;
        Exchange(t);
    }
    Collect();
}

void LinkSimulation::ApplyJamming(double t) {
    if (!options_.jam_enabled) {
        return;
    }
    const double jam_end = options_.jam_start + options_.jam_duration;
    if (!jam_active_ && t >= options_.jam_start && t < jam_end) {
        source_.JamChannel(options_.jam_channel);
        jam_active_ = true;
        LOG(INFO) << "t=" << t << ": jamming channel " << options_.jam_channel;
    } else if (jam_active_ && t >= jam_end) {
        source_.RestoreChannel(options_.jam_channel);
        jam_active_ = false;
        LOG(INFO) << "t=" << t << ": channel " << options_.jam_channel << " restored";
    }
}

void LinkSimulation::MaybeRefill(uint64_t tick, double t) {
    if (tick % static_cast<uint64_t>(options_.refill_interval) != 0) {
        return;
    }
    const double threshold = options_.refill_fraction * static_cast<double>(options_.participant.buffer_capacity);
    if (static_cast<double>(distributor_.MinRemaining()) >= threshold) {
        return;
    }
    distributor_.Distribute(static_cast<size_t>(options_.refill_count), t);
    ++stats_.refills;
    VLOG(2) << "t=" << t << ": refilled " << options_.refill_count << " pattern(s)";
}

void LinkSimulation::MaybeResync(double t) {
    if (options_.resync_interval <= 0.0 || t - last_resync_ < options_.resync_interval) {
        return;
    }
    channel_->Resync(t);
    last_resync_ = t;
    ++stats_.resyncs;
    VLOG(1) << "t=" << t << ": clocks resynchronized";
}

void LinkSimulation::Exchange(double t) {
    const int symbol = static_cast<int>(random_->UniformInt(0, 255));
    const TransmitRecord& tx = sender_.Transmit(symbol);
    const ReceiveResult result = receiver_.Receive(LinkSignal::From(tx));
    ++stats_.transmissions;

    switch (result.reason) {
        case FailureReason::kNone:
            ++stats_.successes;
            break;
        case FailureReason::kLowSnr:
            ++stats_.low_snr_failures;
            break;
        case FailureReason::kClockDrift:
            ++stats_.clock_drift_failures;
            break;
        case FailureReason::kFrequencyMismatch:
            ++stats_.frequency_mismatch_failures;
            break;
    }
    VLOG(3) << "t=" << t << " symbol=" << symbol << (result.success ? " decoded" : " lost");
}

void LinkSimulation::Collect() {
    const PatternSource::Status source = source_.GetStatus();
    stats_.cached_patterns = source.cached_patterns;
    stats_.failovers = source.failovers;
    stats_.exhaustions = sender_.Buffer().GetStatus().exhaustions + receiver_.Buffer().GetStatus().exhaustions;
}

void LinkSimulation::LogSummary() const {
    LOG(INFO) << "===== Link simulation summary =====";
    LOG(INFO) << "Ticks: " << stats_.ticks << " (visible " << stats_.visible_ticks << ")";
    LOG(INFO) << "Transmissions: " << stats_.transmissions << ", decoded " << stats_.successes
              << " (" << stats_.success_rate() * 100.0 << "%)";
    LOG(INFO) << "Failures: low SNR " << stats_.low_snr_failures
              << ", clock drift " << stats_.clock_drift_failures
              << ", frequency mismatch " << stats_.frequency_mismatch_failures;
    LOG(INFO) << "Patterns: " << distributor_.stats().generated << " generated, "
              << stats_.cached_patterns << " from cache, " << stats_.failovers << " failover(s)";
    LOG(INFO) << "Buffers: " << stats_.refills << " refill(s), " << stats_.exhaustions << " exhaustion(s)";
    if (options_.resync_interval > 0.0) {
        LOG(INFO) << "Clock resyncs: " << stats_.resyncs;
    }
}

}  // namespace JitFhss
