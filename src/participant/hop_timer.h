#pragma once

#include <cstdint>

#include "pattern/pattern_buffer.h"

namespace JitFhss {

enum class HopState {
	kIdle,
	kHopping,
};

struct ParticipantOptions {
	double hop_duration = 1.0;        // s
	size_t buffer_capacity = 50;
	size_t low_watermark = 10;
	double snr_threshold_db = 8.0;    // receiver only
};

/**
 * Hop timing shared by Sender and Receiver. Decides whether a hop is due and
 * performs it against the participant's own buffer; what happens after the
 * hop is up to the owner.
 */
class HopTimer {
	public:
		explicit HopTimer(double hop_duration) : hop_duration_(hop_duration) {}

		/**
		 * A participant that never hopped hops immediately. Afterwards a hop is
		 * due once the elapsed time, as read by the local clock, reaches the
		 * hop duration. Edges within kHopEdgeToleranceFraction of the hop
		 * duration count as reached.
		 * @param clock_error Local clock error at now; the error recorded at
		 *        the last hop is subtracted, so only its change counts
		 */
		bool ShouldHop(double now, double clock_error = 0.0) const;

		// Runs the hop check and, if due, pulls the next pattern from buffer
		HopState Tick(double now, double clock_error, PatternBuffer& buffer);

		double current_frequency() const { return current_frequency_; }
		double last_hop_time() const { return last_hop_time_; }
		double last_hop_clock_error() const { return last_hop_clock_error_; }
		double hop_duration() const { return hop_duration_; }
		uint64_t hop_count() const { return hop_count_; }
		uint64_t current_sequence() const { return current_sequence_; }
		bool has_hopped() const { return has_hopped_; }

	private:
		const double hop_duration_;
		double current_frequency_ = 0.0;
		double last_hop_time_ = 0.0;
		double last_hop_clock_error_ = 0.0;
		uint64_t hop_count_ = 0;
		uint64_t current_sequence_ = 0;
		bool has_hopped_ = false;
};

}  // namespace JitFhss
