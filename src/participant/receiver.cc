#include "receiver.h"

#include <algorithm>
#include <cmath>

#include <glog/logging.h>
#include "common/config.h"

namespace JitFhss {

Receiver::Receiver(const ParticipantOptions& options,
		std::shared_ptr<const OrbitKinematics> orbit,
		std::shared_ptr<ChannelQualityModel> channel)
	: orbit_(std::move(orbit)),
	  channel_(std::move(channel)),
	  buffer_(options.buffer_capacity, options.low_watermark),
	  timer_(options.hop_duration),
	  snr_threshold_db_(options.snr_threshold_db) {
	CHECK(orbit_) << "Receiver requires orbit kinematics";
	CHECK(channel_) << "Receiver requires a channel quality model";
}

ReceiveResult Receiver::Receive(const LinkSignal& signal) {
	const double clock_error = channel_->ClockError(current_time_);
	timer_.Tick(current_time_, clock_error, buffer_);

	const OrbitSample sample = orbit_->Sample(current_time_);
	const double snr_db = channel_->SnrDb(sample.range_km, sample.elevation_deg);

	const double expected_freq = timer_.current_frequency();
	const double compensated_freq =
		doppler_.Compensate(signal.received_freq, sample.range_rate_km_s, expected_freq);
	const double freq_error = std::fabs(compensated_freq - expected_freq);

	ReceiveResult result;
	result.reason = Classify(snr_db, clock_error, freq_error, expected_freq);
	result.success = result.reason == FailureReason::kNone;
	if (result.success) {
		result.decoded_symbol = signal.data_symbol;
	} else {
		++sync_errors_;
	}

	ReceiveRecord record;
	record.time = current_time_;
	record.expected_freq = expected_freq;
	record.received_freq = signal.received_freq;
	record.compensated_freq = compensated_freq;
	record.freq_error = freq_error;
	record.snr_db = snr_db;
	record.clock_error = clock_error;
	record.success = result.success;
	record.failure_reason = FailureReasonName(result.reason);
	record.range = signal.range;
	record.range_rate = signal.range_rate;
	record.decoded_symbol = result.decoded_symbol;
	log_.push_back(std::move(record));

	VLOG(3) << "RX t=" << current_time_ << " expected=" << expected_freq
			<< " compensated=" << compensated_freq << " snr=" << snr_db
			<< (result.success ? " ok" : " failed: ") << FailureReasonName(result.reason);
	return result;
}

FailureReason Receiver::Classify(double snr_db, double clock_error, double freq_error,
		double expected_freq) const {
	if (snr_db < snr_threshold_db_) {
		return FailureReason::kLowSnr;
	}
	if (std::fabs(clock_error) > kClockToleranceFraction * timer_.hop_duration()) {
		return FailureReason::kClockDrift;
	}
	if (!(freq_error < kFrequencyToleranceFraction * expected_freq)) {
		return FailureReason::kFrequencyMismatch;
	}
	return FailureReason::kNone;
}

double Receiver::SuccessRate() const {
	if (log_.empty()) {
		return 0.0;
	}
	const auto decoded = std::count_if(log_.begin(), log_.end(),
			[](const ReceiveRecord& r) { return r.success; });
	return static_cast<double>(decoded) / static_cast<double>(log_.size());
}

Receiver::Status Receiver::GetStatus() const {
	const OrbitSample sample = orbit_->Sample(current_time_);
	Status s;
	s.current_time = current_time_;
	s.current_frequency = timer_.current_frequency();
	s.buffer_level = buffer_.Remaining();
	s.hops = timer_.hop_count();
	s.sync_errors = sync_errors_;
	s.range = sample.range_km;
	s.range_rate = sample.range_rate_km_s;
	return s;
}

}  // namespace JitFhss
