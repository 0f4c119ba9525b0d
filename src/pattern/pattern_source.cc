#include "pattern_source.h"

#include <algorithm>
#include <random>

#include <glog/logging.h>
#include "common/config.h"

namespace JitFhss {

PatternSource::PatternSource(const PatternSourceOptions& options, std::shared_ptr<RandomSource> random)
    : options_(options),
      random_(std::move(random)),
      active_(std::max(options.num_channels, 0), true),
      jammed_(std::max(options.num_channels, 0), false),
      jam_probability_(options.jam_probability) {
    if (!random_) {
        random_ = std::make_shared<SeededRandomSource>();
    }
    InitializeFallbackCache();
    VLOG(1) << "PatternSource: " << options_.num_channels << " channels, "
            << options_.num_frequencies << " frequencies in ["
            << options_.min_frequency << ", " << options_.max_frequency
            << "] Hz, cache " << cache_.size();
}

void PatternSource::InitializeFallbackCache() {
    // Own engine with a fixed seed: every source must produce the same cache,
    // independent of the injected RandomSource.
    std::mt19937_64 engine(kFallbackCacheSeed);
    std::uniform_int_distribution<int64_t> dist(1, std::max(options_.num_frequencies, 1));
    cache_.resize(std::max<size_t>(options_.cache_size, 1));
    for (auto& freq : cache_) {
        freq = IndexToFrequency(dist(engine));
    }
}

double PatternSource::IndexToFrequency(int64_t index) const {
    const double step = (options_.max_frequency - options_.min_frequency) /
                        std::max(options_.num_frequencies, 1);
    return options_.min_frequency + static_cast<double>(index - 1) * step;
}

Pattern PatternSource::Generate(double timestamp) {
    absl::MutexLock lock(&mutex_);

    UpdateJammingStatus();

    const int n = options_.num_channels;
    bool found = false;
    int attempts = 0;
    while (attempts < n) {
        ++attempts;
        if (IsUsable(current_idx_)) {
            found = true;
            break;
        }
        current_idx_ = (current_idx_ + 1) % n;
        ++failovers_;
    }
    last_attempts_ = attempts;

    Pattern pattern;
    pattern.timestamp = timestamp;
    pattern.sequence_number = ++sequence_;

    if (found) {
        const int64_t idx = random_->UniformInt(1, options_.num_frequencies);
        pattern.frequency = IndexToFrequency(idx);
        pattern.source_id = current_idx_ + 1;
        pattern.from_cache = false;
        ++live_patterns_;
        VLOG(3) << "Generated " << pattern << " after " << attempts << " attempt(s)";
    } else {
        const size_t cache_idx = pattern.sequence_number % cache_.size();
        pattern.frequency = cache_[cache_idx];
        pattern.source_id = kCacheSourceId;
        pattern.from_cache = true;
        ++cached_patterns_;
        LOG_EVERY_N(WARNING, 50) << "All pattern channels unavailable, serving fallback cache slot "
                                 << cache_idx << " (seq " << pattern.sequence_number << ")";
    }
    return pattern;
}

void PatternSource::UpdateJammingStatus() {
    for (size_t i = 0; i < jammed_.size(); ++i) {
        if (!active_[i]) {
            // Held down administratively until RestoreChannel()
            continue;
        }
        if (jam_probability_ > 0.0 && random_->Uniform() < jam_probability_) {
            if (!jammed_[i]) {
                VLOG(2) << "Channel " << (i + 1) << " jammed";
            }
            jammed_[i] = true;
        } else if (jammed_[i] && random_->Uniform() < options_.recovery_probability) {
            jammed_[i] = false;
            VLOG(2) << "Channel " << (i + 1) << " recovered";
        }
    }
}

bool PatternSource::IsUsable(int idx) const {
    return active_[idx] && !jammed_[idx];
}

bool PatternSource::ValidChannel(int channel_id) const {
    if (channel_id < 1 || channel_id > options_.num_channels) {
        LOG(WARNING) << "Ignoring unknown pattern channel " << channel_id
                     << " (have " << options_.num_channels << ")";
        return false;
    }
    return true;
}

void PatternSource::JamChannel(int channel_id) {
    if (!ValidChannel(channel_id)) return;
    absl::MutexLock lock(&mutex_);
    active_[channel_id - 1] = false;
    jammed_[channel_id - 1] = true;
    LOG(INFO) << "Pattern channel " << channel_id << " jammed";
}

void PatternSource::RestoreChannel(int channel_id) {
    if (!ValidChannel(channel_id)) return;
    absl::MutexLock lock(&mutex_);
    active_[channel_id - 1] = true;
    jammed_[channel_id - 1] = false;
    LOG(INFO) << "Pattern channel " << channel_id << " restored";
}

void PatternSource::SetJamProbability(double probability) {
    absl::MutexLock lock(&mutex_);
    jam_probability_ = std::clamp(probability, 0.0, 1.0);
}

PatternSource::Status PatternSource::GetStatus() const {
    absl::MutexLock lock(&mutex_);
    Status s;
    s.active_channels = static_cast<int>(std::count(active_.begin(), active_.end(), true));
    s.jammed_channels = static_cast<int>(std::count(jammed_.begin(), jammed_.end(), true));
    s.current_channel = current_idx_ + 1;
    s.sequence_number = sequence_;
    s.live_patterns = live_patterns_;
    s.cached_patterns = cached_patterns_;
    s.failovers = failovers_;
    s.last_attempts = last_attempts_;
    return s;
}

}  // namespace JitFhss
