#pragma once

#include <optional>
#include <string>

namespace JitFhss {

/**
 * Decode failure classes, in the order they are checked
 */
enum class FailureReason {
    kNone = 0,
    kLowSnr,
    kClockDrift,
    kFrequencyMismatch,
};

// Log representation: "" on success, "Low SNR", "Clock drift", "Frequency mismatch"
const char* FailureReasonName(FailureReason reason);

/**
 * One satellite transmission as logged by the Sender
 */
struct TransmitRecord {
    double time = 0.0;
    double transmit_freq = 0.0;   // Hz
    double received_freq = 0.0;   // Hz, after Doppler
    double doppler_shift = 0.0;   // Hz
    double range = 0.0;           // km
    double range_rate = 0.0;      // km/s
    int data_symbol = 0;
};

/**
 * What arrives at the ground station for one transmission
 */
struct LinkSignal {
    double received_freq = 0.0;
    int data_symbol = 0;
    double range = 0.0;
    double range_rate = 0.0;

    static LinkSignal From(const TransmitRecord& tx) {
        return {tx.received_freq, tx.data_symbol, tx.range, tx.range_rate};
    }
};

/**
 * One decode attempt as logged by the Receiver
 */
struct ReceiveRecord {
    double time = 0.0;
    double expected_freq = 0.0;
    double received_freq = 0.0;
    double compensated_freq = 0.0;
    double freq_error = 0.0;
    double snr_db = 0.0;
    double clock_error = 0.0;
    bool success = false;
    std::string failure_reason;
    double range = 0.0;
    double range_rate = 0.0;
    std::optional<int> decoded_symbol;
};

struct ReceiveResult {
    bool success = false;
    std::optional<int> decoded_symbol;
    FailureReason reason = FailureReason::kNone;
};

}  // namespace JitFhss
