#include "pattern_buffer.h"

#include <algorithm>

#include <glog/logging.h>

namespace JitFhss {

PatternBuffer::PatternBuffer(size_t capacity, size_t low_watermark)
    : capacity_(std::max<size_t>(capacity, 1)),
      low_watermark_(std::min(low_watermark, std::max<size_t>(capacity, 1))) {
    patterns_.reserve(capacity_ + 1);
}

bool PatternBuffer::Add(const Pattern& pattern) {
    if (!pattern.IsValid() || pattern.sequence_number <= max_sequence_seen_) {
        ++rejected_;
        LOG_EVERY_N(WARNING, 20) << "Duplicate or out-of-order pattern " << pattern.sequence_number
                                 << " (newest accepted " << max_sequence_seen_ << ")";
        return false;
    }

    auto pos = std::upper_bound(patterns_.begin(), patterns_.end(), pattern,
            [](const Pattern& a, const Pattern& b) {
                return a.sequence_number < b.sequence_number;
            });
    patterns_.insert(pos, pattern);
    max_sequence_seen_ = std::max(max_sequence_seen_, pattern.sequence_number);

    TrimToCapacity();
    exhausted_ = false;
    low_ = Remaining() < low_watermark_;
    return true;
}

void PatternBuffer::TrimToCapacity() {
    // Consumed patterns go first
    size_t consumed_drop = 0;
    while (patterns_.size() - consumed_drop > capacity_ && consumed_drop < cursor_) {
        ++consumed_drop;
    }
    if (consumed_drop > 0) {
        patterns_.erase(patterns_.begin(), patterns_.begin() + consumed_drop);
        cursor_ -= consumed_drop;
        dropped_ += consumed_drop;
    }

    // Then the oldest pending ones, keeping the pattern the cursor points at
    while (patterns_.size() > capacity_) {
        const size_t victim = (cursor_ + 1 < patterns_.size()) ? cursor_ + 1 : patterns_.size() - 1;
        VLOG(2) << "Buffer full, dropping pending pattern " << patterns_[victim].sequence_number;
        patterns_.erase(patterns_.begin() + victim);
        ++dropped_;
    }
}

Pattern PatternBuffer::Next(double now) {
    Pattern pattern;
    if (cursor_ < patterns_.size()) {
        pattern = patterns_[cursor_++];
        exhausted_ = false;
    } else {
        cursor_ = patterns_.size();
        if (patterns_.empty()) {
            LOG_EVERY_N(WARNING, 100) << "Pattern buffer empty at t=" << now;
        } else {
            pattern = patterns_.back();
            ++exhaustions_;
            LOG_EVERY_N(WARNING, 100) << "Pattern buffer exhausted at t=" << now
                                      << ", repeating seq " << pattern.sequence_number
                                      << " (receiver and sender may desynchronize)";
        }
        exhausted_ = true;
    }

    low_ = Remaining() < low_watermark_;
    if (low_) {
        VLOG(2) << "Pattern buffer low: " << Remaining() << " remaining";
        if (low_callback_) {
            low_callback_(Remaining());
        }
    }
    return pattern;
}

void PatternBuffer::Compact() {
    if (cursor_ == 0) {
        return;
    }
    // An exhausted buffer keeps its last pattern so Next() can keep repeating it
    const size_t keep_from = (cursor_ >= patterns_.size() && !patterns_.empty())
                                 ? patterns_.size() - 1
                                 : cursor_;
    patterns_.erase(patterns_.begin(), patterns_.begin() + keep_from);
    cursor_ -= keep_from;
}

void PatternBuffer::Reset() {
    patterns_.clear();
    cursor_ = 0;
    low_ = false;
    exhausted_ = false;
}

PatternBuffer::Status PatternBuffer::GetStatus() const {
    Status s;
    s.total_patterns = patterns_.size();
    s.cursor = cursor_;
    s.remaining = Remaining();
    s.max_sequence_seen = max_sequence_seen_;
    s.exhaustions = exhaustions_;
    s.rejected = rejected_;
    s.dropped = dropped_;
    return s;
}

}  // namespace JitFhss
