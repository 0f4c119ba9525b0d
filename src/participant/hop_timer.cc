#include "hop_timer.h"

#include <glog/logging.h>

#include "common/config.h"

namespace JitFhss {

bool HopTimer::ShouldHop(double now, double clock_error) const {
	if (!has_hopped_) {
		return true;
	}
	// Elapsed time on the local clock: a constant offset cancels out
	const double elapsed = (now + clock_error) - (last_hop_time_ + last_hop_clock_error_);
	return elapsed >= hop_duration_ * (1.0 - kHopEdgeToleranceFraction);
}

HopState HopTimer::Tick(double now, double clock_error, PatternBuffer& buffer) {
	if (!ShouldHop(now, clock_error)) {
		return HopState::kIdle;
	}

	Pattern pattern = buffer.Next(now);
	if (!pattern.IsValid()) {
		// Nothing to hop to; keep the current frequency and try again next tick
		LOG_EVERY_N(WARNING, 100) << "No pattern available for hop at t=" << now;
		return HopState::kIdle;
	}

	current_frequency_ = pattern.frequency;
	current_sequence_ = pattern.sequence_number;
	last_hop_time_ = now;
	last_hop_clock_error_ = clock_error;
	has_hopped_ = true;
	++hop_count_;
	VLOG(3) << "Hop " << hop_count_ << " at t=" << now << " -> " << pattern;

	if (buffer.Remaining() < buffer.low_watermark()) {
		buffer.Compact();
	}
	return HopState::kHopping;
}

}  // namespace JitFhss
