#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

#include "pattern.h"

namespace JitFhss {

/**
 * PatternBuffer keeps the patterns delivered to one participant, ordered by
 * sequence number and bounded by capacity. Consumption is sequential through
 * a cursor; running past the end repeats the last pattern instead of failing.
 *
 * Add() rejects anything at or below the highest sequence number ever
 * accepted, so duplicates and stale redeliveries never re-enter.
 *
 * @threading Owned by a single participant; not thread-safe.
 */
class PatternBuffer {
public:
    // Invoked with Remaining() whenever a Next() leaves the buffer below the low watermark
    using LowBufferCallback = std::function<void(size_t remaining)>;

    struct Status {
        size_t total_patterns = 0;
        size_t cursor = 0;
        size_t remaining = 0;
        uint64_t max_sequence_seen = 0;
        uint64_t exhaustions = 0;
        uint64_t rejected = 0;
        uint64_t dropped = 0;
    };

    PatternBuffer(size_t capacity, size_t low_watermark);

    /**
     * @return false when the pattern is a duplicate or older than the newest accepted one
     */
    bool Add(const Pattern& pattern);

    /**
     * Next pattern in sequence order. Never fails: an exhausted buffer returns
     * its last pattern again, an empty buffer returns an invalid Pattern.
     * @param now Simulation time, for diagnostics only
     */
    Pattern Next(double now);

    size_t Remaining() const { return patterns_.size() - cursor_; }

    // Drop consumed patterns and rewind the cursor
    void Compact();

    void Reset();

    bool IsLow() const { return low_; }
    bool IsExhausted() const { return exhausted_; }

    void SetLowBufferCallback(LowBufferCallback callback) { low_callback_ = std::move(callback); }

    size_t Size() const { return patterns_.size(); }
    size_t capacity() const { return capacity_; }
    size_t low_watermark() const { return low_watermark_; }
    uint64_t max_sequence_seen() const { return max_sequence_seen_; }

    const std::vector<Pattern>& Contents() const { return patterns_; }

    Status GetStatus() const;

private:
    void TrimToCapacity();

    const size_t capacity_;
    const size_t low_watermark_;

    std::vector<Pattern> patterns_;
    // Index of the next pattern to hand out
    size_t cursor_ = 0;
    uint64_t max_sequence_seen_ = 0;

    bool low_ = false;
    bool exhausted_ = false;
    uint64_t exhaustions_ = 0;
    uint64_t rejected_ = 0;
    uint64_t dropped_ = 0;

    LowBufferCallback low_callback_;
};

}  // namespace JitFhss
