#include "link_records.h"

namespace JitFhss {

const char* FailureReasonName(FailureReason reason) {
	switch (reason) {
		case FailureReason::kNone:
			return "";
		case FailureReason::kLowSnr:
			return "Low SNR";
		case FailureReason::kClockDrift:
			return "Clock drift";
		case FailureReason::kFrequencyMismatch:
			return "Frequency mismatch";
	}
	return "Unknown";
}

}  // namespace JitFhss
