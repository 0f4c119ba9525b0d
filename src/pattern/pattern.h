#pragma once

#include <cstdint>
#include <ostream>

namespace JitFhss {

/// source_id carried by patterns served from the fallback cache
inline constexpr int kCacheSourceId = -1;

/**
 * One sequenced frequency assignment. Delivered by value to every
 * participant; two patterns are the same pattern when frequency, sequence
 * number and source agree. The timestamp records delivery time and may
 * differ between copies.
 */
struct Pattern {
    double frequency = 0.0;       // Hz
    double timestamp = 0.0;       // s
    uint64_t sequence_number = 0; // 0 means no pattern
    int source_id = 0;
    bool from_cache = false;

    bool IsValid() const { return sequence_number != 0; }

    // Copy with the timestamp shifted by a delivery delay
    Pattern Delayed(double delay) const {
        Pattern p = *this;
        p.timestamp += delay;
        return p;
    }
};

inline bool operator==(const Pattern& a, const Pattern& b) {
    return a.frequency == b.frequency &&
           a.sequence_number == b.sequence_number &&
           a.source_id == b.source_id;
}

inline bool operator!=(const Pattern& a, const Pattern& b) {
    return !(a == b);
}

inline std::ostream& operator<<(std::ostream& os, const Pattern& p) {
    return os << "Pattern{seq=" << p.sequence_number
              << " freq=" << p.frequency
              << " src=" << p.source_id
              << (p.from_cache ? " cache" : "")
              << " t=" << p.timestamp << "}";
}

}  // namespace JitFhss
