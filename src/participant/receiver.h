#pragma once

#include <memory>
#include <vector>

#include "channel/channel_quality.h"
#include "channel/doppler_compensator.h"
#include "hop_timer.h"
#include "link_records.h"
#include "orbit/orbit_kinematics.h"
#include "pattern/pattern_buffer.h"

namespace JitFhss {

/**
 * Ground receiver. Tracks the hop sequence from its own buffer, with hop
 * timing read through its imperfect local clock, and classifies every
 * incoming signal as decoded or failed.
 *
 * Decode succeeds only if, in this order, SNR reaches the threshold, the
 * clock error stays within 10% of a hop, and the Doppler-compensated
 * frequency lands within 1% of the expected one. The first failing check
 * is the one recorded.
 */
class Receiver {
	public:
		struct Status {
			double current_time = 0.0;
			double current_frequency = 0.0;
			size_t buffer_level = 0;
			uint64_t hops = 0;
			uint64_t sync_errors = 0;
			double range = 0.0;
			double range_rate = 0.0;
		};

		Receiver(const ParticipantOptions& options,
				std::shared_ptr<const OrbitKinematics> orbit,
				std::shared_ptr<ChannelQualityModel> channel);

		void SetTime(double t) { current_time_ = t; }
		void AdvanceTime(double dt) { current_time_ += dt; }
		double current_time() const { return current_time_; }

		ReceiveResult Receive(const LinkSignal& signal);

		PatternBuffer& Buffer() { return buffer_; }
		const PatternBuffer& Buffer() const { return buffer_; }
		const HopTimer& Timer() const { return timer_; }
		DopplerCompensator& Doppler() { return doppler_; }

		const std::vector<ReceiveRecord>& Log() const { return log_; }
		void ClearLog() { log_.clear(); }

		// Fraction of logged receptions that decoded; 0 with an empty log
		double SuccessRate() const;
		uint64_t sync_errors() const { return sync_errors_; }

		Status GetStatus() const;

	private:
		FailureReason Classify(double snr_db, double clock_error, double freq_error,
				double expected_freq) const;

		std::shared_ptr<const OrbitKinematics> orbit_;
		std::shared_ptr<ChannelQualityModel> channel_;
		PatternBuffer buffer_;
		HopTimer timer_;
		DopplerCompensator doppler_;
		const double snr_threshold_db_;
		double current_time_ = 0.0;
		uint64_t sync_errors_ = 0;
		std::vector<ReceiveRecord> log_;
};

}  // namespace JitFhss
