#include "channel_quality.h"

#include <algorithm>
#include <cmath>

#include <glog/logging.h>
#include "common/config.h"

namespace JitFhss {

namespace {

constexpr double kPi = 3.14159265358979323846;

double SinDeg(double deg) {
    return std::sin(deg * kPi / 180.0);
}

// Below this elevation path-length factors stop growing
constexpr double kMinPathElevationDeg = 5.0;

constexpr double kZenithAtmosphericDb = 0.2;
constexpr double kCloudProbability = 0.1;
constexpr double kMaxCloudMarginDb = 2.0;

constexpr double kIonosphericLossAt1GHzDb = 0.5;
constexpr double kScintillationRmsDb = 0.3;

constexpr double kRainProbability = 0.1;
constexpr double kRainHeightKm = 3.0;
constexpr double kMaxRainRateMmHr = 10.0;
// ITU-R specific attenuation gamma = k * R^alpha, S-band approximation
constexpr double kRainK = 0.0001;
constexpr double kRainAlpha = 1.0;

std::shared_ptr<RandomSource> OrDefault(std::shared_ptr<RandomSource> random) {
    if (random) return random;
    return std::make_shared<SeededRandomSource>();
}

}  // namespace

ChannelQualityModel::ChannelQualityModel(const LinkBudgetOptions& options,
                                         std::shared_ptr<RandomSource> random,
                                         const ClockGrade& sender_grade,
                                         const ClockGrade& receiver_grade)
    : options_(options),
      random_(OrDefault(std::move(random))),
      sender_clock_(sender_grade, *random_),
      receiver_clock_(receiver_grade, *random_) {}

SnrBreakdown ChannelQualityModel::Snr(double range_km, double elevation_deg) {
    SnrBreakdown b;
    b.fspl_db = FreeSpacePathLoss(range_km);
    b.atmospheric_db = AtmosphericLoss(elevation_deg);
    b.ionospheric_db = IonosphericLoss(elevation_deg);
    b.rain_db = RainFade(elevation_deg);
    b.eirp_dbw = options_.tx_power_dbw + options_.tx_gain_dbi;
    b.rx_power_dbw = b.eirp_dbw - b.fspl_db - b.atmospheric_db - b.ionospheric_db - b.rain_db +
                     options_.rx_gain_dbi;
    b.noise_power_dbw = NoisePower();
    b.snr_db = b.rx_power_dbw - b.noise_power_dbw;
    VLOG(4) << "SNR at " << range_km << " km / " << elevation_deg << " deg: " << b.snr_db
            << " dB (fspl " << b.fspl_db << ", atm " << b.atmospheric_db
            << ", iono " << b.ionospheric_db << ", rain " << b.rain_db << ")";
    return b;
}

double ChannelQualityModel::FreeSpacePathLoss(double range_km) const {
    const double range_m = range_km * 1000.0;
    const double lambda = kSpeedOfLightExact / options_.carrier_frequency;
    return 20.0 * std::log10(4.0 * kPi * range_m / lambda);
}

double ChannelQualityModel::NoisePower() const {
    return kBoltzmannDbw + 10.0 * std::log10(options_.system_temp_k) +
           10.0 * std::log10(options_.bandwidth_hz);
}

double ChannelQualityModel::AtmosphericLoss(double elevation_deg) {
    const double path_factor = 1.0 / SinDeg(std::max(elevation_deg, kMinPathElevationDeg));
    double loss = kZenithAtmosphericDb * path_factor;
    if (random_->Uniform() < kCloudProbability) {
        loss += random_->Uniform() * kMaxCloudMarginDb;
    }
    return loss;
}

double ChannelQualityModel::IonosphericLoss(double elevation_deg) {
    const double freq_ghz = options_.carrier_frequency / 1e9;
    const double zenith = kIonosphericLossAt1GHzDb / (freq_ghz * freq_ghz);
    const double elev_factor = elevation_deg < 20.0 ? 1.0 + (20.0 - elevation_deg) / 10.0 : 1.0;
    const double scintillation = std::fabs(random_->Normal() * kScintillationRmsDb);
    return zenith * elev_factor + scintillation;
}

double ChannelQualityModel::RainFade(double elevation_deg) {
    if (random_->Uniform() >= kRainProbability) {
        return 0.0;
    }
    const double path_km = elevation_deg < 90.0
                               ? kRainHeightKm / SinDeg(std::max(elevation_deg, kMinPathElevationDeg))
                               : kRainHeightKm;
    const double rain_rate = random_->Uniform() * kMaxRainRateMmHr;
    const double specific_atten = kRainK * std::pow(rain_rate, kRainAlpha);
    return specific_atten * path_km;
}

double ChannelQualityModel::ClockError(double t) const {
    return receiver_clock_.Error(t) - sender_clock_.Error(t);
}

void ChannelQualityModel::Resync(double t) {
    sender_clock_.Reset(t);
    const double offset = ClockError(t);
    // Ground reference disciplines the receiver onto the sender's time
    receiver_clock_.Sync(t, offset);
    VLOG(1) << "Clocks resynchronized at t=" << t << ", removed offset " << offset;
}

}  // namespace JitFhss
