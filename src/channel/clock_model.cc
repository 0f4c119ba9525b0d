#include "clock_model.h"

#include <glog/logging.h>

namespace JitFhss {

ClockModel::ClockModel(const ClockGrade& grade, RandomSource& random)
    : grade_name_(grade.name),
      bias_(random.Normal() * grade.bias_sigma),
      drift_(random.Normal() * grade.drift_sigma),
      aging_(random.Normal() * grade.aging_sigma) {
    VLOG(1) << "ClockModel[" << grade_name_ << "] bias=" << bias_
            << " drift=" << drift_ << " aging=" << aging_;
}

ClockModel::ClockModel(double bias, double drift, double aging, double epoch)
    : grade_name_("fixed"), bias_(bias), drift_(drift), aging_(aging), epoch_(epoch) {}

double ClockModel::Error(double t) const {
    const double dt = t - epoch_;
    return bias_ + drift_ * dt + 0.5 * aging_ * dt * dt;
}

double ClockModel::DriftRate(double t) const {
    return drift_ + aging_ * (t - epoch_);
}

void ClockModel::Reset(double t) {
    bias_ = Error(t);
    // Drift accumulated up to t is folded into the new rate
    drift_ = DriftRate(t);
    epoch_ = t;
}

void ClockModel::Sync(double t, double correction) {
    bias_ = Error(t) - correction;
    drift_ = DriftRate(t);
    epoch_ = t;
    VLOG(2) << "ClockModel[" << grade_name_ << "] synced at t=" << t
            << ", residual bias " << bias_;
}

}  // namespace JitFhss
