#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "absl/synchronization/mutex.h"
#include "common/random_source.h"
#include "pattern.h"

namespace JitFhss {

struct PatternSourceOptions {
    int num_channels = 3;
    int num_frequencies = 100;
    double min_frequency = 2.0e9;  // Hz
    double max_frequency = 2.1e9;  // Hz
    size_t cache_size = 1000;
    // Per-channel chance of a jamming event on every Generate()
    double jam_probability = 0.001;
    // Chance that a jammed channel clears on every Generate()
    double recovery_probability = 0.1;
};

/**
 * PatternSource hands out sequenced hop patterns drawn from N redundant
 * entropy channels. When the current channel is down it fails over
 * round-robin; when every channel is down it serves the fallback cache.
 * Generate() never fails.
 *
 * @threading All methods are safe to call concurrently.
 */
class PatternSource {
public:
    struct Status {
        int active_channels = 0;
        int jammed_channels = 0;
        int current_channel = 0;   // 1-based
        uint64_t sequence_number = 0;
        uint64_t live_patterns = 0;
        uint64_t cached_patterns = 0;
        uint64_t failovers = 0;
        int last_attempts = 0;
    };

    PatternSource(const PatternSourceOptions& options, std::shared_ptr<RandomSource> random);

    Pattern Generate(double timestamp);

    // Administrative overrides; channel ids are 1-based
    void JamChannel(int channel_id);
    void RestoreChannel(int channel_id);

    void SetJamProbability(double probability);

    double IndexToFrequency(int64_t index) const;

    // Frequency served from cache slot `index`
    double CachedFrequency(size_t index) const { return cache_[index]; }
    const std::vector<double>& Cache() const { return cache_; }

    Status GetStatus() const;

    const PatternSourceOptions& options() const { return options_; }

private:
    void InitializeFallbackCache();
    void UpdateJammingStatus() ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);
    bool IsUsable(int idx) const ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);
    bool ValidChannel(int channel_id) const;

    const PatternSourceOptions options_;
    std::vector<double> cache_;

    mutable absl::Mutex mutex_;
    std::shared_ptr<RandomSource> random_ ABSL_GUARDED_BY(mutex_);
    std::vector<bool> active_ ABSL_GUARDED_BY(mutex_);
    std::vector<bool> jammed_ ABSL_GUARDED_BY(mutex_);
    int current_idx_ ABSL_GUARDED_BY(mutex_) = 0;
    uint64_t sequence_ ABSL_GUARDED_BY(mutex_) = 0;
    double jam_probability_ ABSL_GUARDED_BY(mutex_);
    uint64_t live_patterns_ ABSL_GUARDED_BY(mutex_) = 0;
    uint64_t cached_patterns_ ABSL_GUARDED_BY(mutex_) = 0;
    uint64_t failovers_ ABSL_GUARDED_BY(mutex_) = 0;
    int last_attempts_ ABSL_GUARDED_BY(mutex_) = 0;
};

}  // namespace JitFhss
