#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "pattern_buffer.h"
#include "pattern_source.h"

namespace JitFhss {

/**
 * Fans every generated pattern out to all registered buffers. Each buffer
 * receives the same Pattern value; only the timestamp is shifted by that
 * destination's delivery delay, evaluated when the batch is sent.
 */
class PatternDistributor {
public:
    using DelayFunc = std::function<double()>;

    struct Stats {
        uint64_t generated = 0;
        uint64_t delivered = 0;
        uint64_t rejected = 0;
    };

    explicit PatternDistributor(PatternSource& source) : source_(source) {}

    void AddDestination(const std::string& name, PatternBuffer& buffer, DelayFunc delay);
    void AddDestination(const std::string& name, PatternBuffer& buffer, double fixed_delay);

    /**
     * Generates `count` patterns at time `now` and delivers each to every destination.
     * @return number of patterns accepted by every destination
     */
    size_t Distribute(size_t count, double now);

    // Lowest Remaining() over all destinations
    size_t MinRemaining() const;

    const Stats& stats() const { return stats_; }
    size_t num_destinations() const { return destinations_.size(); }

private:
    struct Destination {
        std::string name;
        PatternBuffer* buffer;
        DelayFunc delay;
    };

    PatternSource& source_;
    std::vector<Destination> destinations_;
    Stats stats_;
};

}  // namespace JitFhss
