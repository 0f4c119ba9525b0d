#pragma once

#include <memory>
#include <vector>

#include "channel/doppler_compensator.h"
#include "hop_timer.h"
#include "link_records.h"
#include "orbit/orbit_kinematics.h"
#include "pattern/pattern_buffer.h"

namespace JitFhss {

/**
 * Satellite transmitter. Hops through its own pattern buffer and logs every
 * transmission with the Doppler-shifted frequency the ground will see.
 */
class Sender {
	public:
		struct Status {
			double current_time = 0.0;
			double current_frequency = 0.0;
			size_t buffer_level = 0;
			uint64_t hops = 0;
			double range = 0.0;
			double range_rate = 0.0;
			bool visible = false;
		};

		Sender(const ParticipantOptions& options, std::shared_ptr<const OrbitKinematics> orbit);

		void SetTime(double t) { current_time_ = t; }
		void AdvanceTime(double dt) { current_time_ += dt; }
		double current_time() const { return current_time_; }

		const TransmitRecord& Transmit(int data_symbol);

		// One-way uplink delay to the satellite at the current time
		double DeliveryDelay() const;

		PatternBuffer& Buffer() { return buffer_; }
		const PatternBuffer& Buffer() const { return buffer_; }
		const HopTimer& Timer() const { return timer_; }

		const std::vector<TransmitRecord>& Log() const { return log_; }
		void ClearLog() { log_.clear(); }

		Status GetStatus(double min_elevation_deg = 5.0) const;

	private:
		std::shared_ptr<const OrbitKinematics> orbit_;
		PatternBuffer buffer_;
		HopTimer timer_;
		DopplerCompensator doppler_;
		double current_time_ = 0.0;
		std::vector<TransmitRecord> log_;
};

}  // namespace JitFhss
