#include "sender.h"

#include <glog/logging.h>

namespace JitFhss {

Sender::Sender(const ParticipantOptions& options, std::shared_ptr<const OrbitKinematics> orbit)
	: orbit_(std::move(orbit)),
	  buffer_(options.buffer_capacity, options.low_watermark),
	  timer_(options.hop_duration) {
	CHECK(orbit_) << "Sender requires orbit kinematics";
}

const TransmitRecord& Sender::Transmit(int data_symbol) {
	timer_.Tick(current_time_, 0.0, buffer_);

	const OrbitSample sample = orbit_->Sample(current_time_);
	const double tx_freq = timer_.current_frequency();
	const double rx_freq = doppler_.Apply(tx_freq, sample.range_rate_km_s);

	TransmitRecord record;
	record.time = current_time_;
	record.transmit_freq = tx_freq;
	record.received_freq = rx_freq;
	record.doppler_shift = rx_freq - tx_freq;
	record.range = sample.range_km;
	record.range_rate = sample.range_rate_km_s;
	record.data_symbol = data_symbol;
	log_.push_back(record);

	VLOG(3) << "TX t=" << current_time_ << " f=" << tx_freq << " doppler=" << record.doppler_shift
			<< " symbol=" << data_symbol;
	return log_.back();
}

double Sender::DeliveryDelay() const {
	return doppler_.PropagationDelay(orbit_->Sample(current_time_).range_km);
}

Sender::Status Sender::GetStatus(double min_elevation_deg) const {
	const OrbitSample sample = orbit_->Sample(current_time_);
	Status s;
	s.current_time = current_time_;
	s.current_frequency = timer_.current_frequency();
	s.buffer_level = buffer_.Remaining();
	s.hops = timer_.hop_count();
	s.range = sample.range_km;
	s.range_rate = sample.range_rate_km_s;
	s.visible = sample.elevation_deg >= min_elevation_deg;
	return s;
}

}  // namespace JitFhss
