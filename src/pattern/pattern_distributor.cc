#include "pattern_distributor.h"

#include <algorithm>
#include <limits>

#include <glog/logging.h>

namespace JitFhss {

void PatternDistributor::AddDestination(const std::string& name, PatternBuffer& buffer, DelayFunc delay) {
    destinations_.push_back({name, &buffer, std::move(delay)});
}

void PatternDistributor::AddDestination(const std::string& name, PatternBuffer& buffer, double fixed_delay) {
    AddDestination(name, buffer, [fixed_delay]() { return fixed_delay; });
}

size_t PatternDistributor::Distribute(size_t count, double now) {
    std::vector<double> delays;
    delays.reserve(destinations_.size());
    for (const auto& dest : destinations_) {
        delays.push_back(dest.delay ? dest.delay() : 0.0);
    }

    size_t accepted_everywhere = 0;
    for (size_t i = 0; i < count; ++i) {
        const Pattern pattern = source_.Generate(now);
        ++stats_.generated;

        bool all_accepted = true;
        for (size_t d = 0; d < destinations_.size(); ++d) {
            if (destinations_[d].buffer->Add(pattern.Delayed(delays[d]))) {
                ++stats_.delivered;
            } else {
                ++stats_.rejected;
                all_accepted = false;
                VLOG(2) << "Destination " << destinations_[d].name << " rejected " << pattern;
            }
        }
        if (all_accepted) {
            ++accepted_everywhere;
        }
    }

    VLOG(2) << "Distributed " << count << " pattern(s) to " << destinations_.size()
            << " destination(s) at t=" << now;
    return accepted_everywhere;
}

size_t PatternDistributor::MinRemaining() const {
    if (destinations_.empty()) {
        return 0;
    }
    size_t min_remaining = std::numeric_limits<size_t>::max();
    for (const auto& dest : destinations_) {
        min_remaining = std::min(min_remaining, dest.buffer->Remaining());
    }
    return min_remaining;
}

}  // namespace JitFhss
