#include "configuration.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

#include "channel/channel_quality.h"
#include "orbit/circular_orbit.h"
#include "participant/hop_timer.h"
#include "pattern/pattern_source.h"
#include "sim/link_simulation.h"

namespace JitFhss {

// Template specializations for environment variable parsing
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoi(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoull(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<double> ConfigValue<double>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stod(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        return std::string(env_val);
    }
    return std::nullopt;
}

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        std::string val(env_val);
        std::transform(val.begin(), val.end(), val.begin(), ::tolower);
        if (val == "true" || val == "1" || val == "yes" || val == "on") {
            return true;
        } else if (val == "false" || val == "0" || val == "no" || val == "off") {
            return false;
        }
        LOG(WARNING) << "Invalid boolean value for env var " << env_var_ << ": " << env_val;
    }
    return std::nullopt;
}

namespace {

template<typename T>
void setIfPresent(const YAML::Node& section, const char* key, ConfigValue<T>& value) {
    if (section[key]) value.set(section[key].template as<T>());
}

} // namespace

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        applyYAML(yaml);
        LOG(INFO) << "Loaded configuration from " << filename;
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file: " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        applyYAML(yaml);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

void Configuration::applyYAML(const YAML::Node& yaml) {
    if (!yaml["jitfhss"]) {
        LOG(WARNING) << "Configuration has no 'jitfhss' root; keeping current values";
        return;
    }
    auto root = yaml["jitfhss"];

    // Simulation
    if (root["simulation"]) {
        auto sim = root["simulation"];
        setIfPresent(sim, "duration", config_.simulation.duration);
        setIfPresent(sim, "time_step", config_.simulation.time_step);
        setIfPresent(sim, "min_elevation_deg", config_.simulation.min_elevation_deg);
        setIfPresent(sim, "seed", config_.simulation.seed);
        setIfPresent(sim, "refill_interval", config_.simulation.refill_interval);
        setIfPresent(sim, "refill_count", config_.simulation.refill_count);
        setIfPresent(sim, "refill_fraction", config_.simulation.refill_fraction);
        setIfPresent(sim, "resync_interval", config_.simulation.resync_interval);
    }

    // Source
    if (root["source"]) {
        auto source = root["source"];
        setIfPresent(source, "num_channels", config_.source.num_channels);
        setIfPresent(source, "num_frequencies", config_.source.num_frequencies);
        setIfPresent(source, "min_frequency", config_.source.min_frequency);
        setIfPresent(source, "max_frequency", config_.source.max_frequency);
        setIfPresent(source, "cache_size", config_.source.cache_size);
        setIfPresent(source, "jam_probability", config_.source.jam_probability);
        setIfPresent(source, "recovery_probability", config_.source.recovery_probability);
    }

    // Buffer
    if (root["buffer"]) {
        auto buffer = root["buffer"];
        setIfPresent(buffer, "capacity", config_.buffer.capacity);
        setIfPresent(buffer, "low_watermark", config_.buffer.low_watermark);
    }

    // Hop
    if (root["hop"]) {
        auto hop = root["hop"];
        setIfPresent(hop, "hop_duration", config_.hop.hop_duration);
        setIfPresent(hop, "snr_threshold_db", config_.hop.snr_threshold_db);
        setIfPresent(hop, "doppler_compensation", config_.hop.doppler_compensation);
    }

    // Orbit
    if (root["orbit"]) {
        auto orbit = root["orbit"];
        setIfPresent(orbit, "altitude_km", config_.orbit.altitude_km);
        setIfPresent(orbit, "inclination_deg", config_.orbit.inclination_deg);
        setIfPresent(orbit, "ground_lat_deg", config_.orbit.ground_lat_deg);
        setIfPresent(orbit, "ground_lon_deg", config_.orbit.ground_lon_deg);
    }

    // Link budget
    if (root["link"]) {
        auto link = root["link"];
        setIfPresent(link, "carrier_frequency", config_.link.carrier_frequency);
        setIfPresent(link, "tx_power_dbw", config_.link.tx_power_dbw);
        setIfPresent(link, "tx_gain_dbi", config_.link.tx_gain_dbi);
        setIfPresent(link, "rx_gain_dbi", config_.link.rx_gain_dbi);
        setIfPresent(link, "system_temp_k", config_.link.system_temp_k);
        setIfPresent(link, "bandwidth_hz", config_.link.bandwidth_hz);
    }

    // Jamming window
    if (root["jamming"]) {
        auto jamming = root["jamming"];
        setIfPresent(jamming, "enabled", config_.jamming.enabled);
        setIfPresent(jamming, "channel", config_.jamming.channel);
        setIfPresent(jamming, "start", config_.jamming.start);
        setIfPresent(jamming, "duration", config_.jamming.duration);
    }
}

PatternSourceOptions Configuration::makeSourceOptions() const {
    PatternSourceOptions options;
    options.num_channels = config_.source.num_channels.get();
    options.num_frequencies = config_.source.num_frequencies.get();
    options.min_frequency = config_.source.min_frequency.get();
    options.max_frequency = config_.source.max_frequency.get();
    options.cache_size = config_.source.cache_size.get();
    options.jam_probability = config_.source.jam_probability.get();
    options.recovery_probability = config_.source.recovery_probability.get();
    return options;
}

ParticipantOptions Configuration::makeParticipantOptions() const {
    ParticipantOptions options;
    options.hop_duration = config_.hop.hop_duration.get();
    options.snr_threshold_db = config_.hop.snr_threshold_db.get();
    options.buffer_capacity = config_.buffer.capacity.get();
    const size_t watermark = config_.buffer.low_watermark.get();
    options.low_watermark = watermark > 0 ? watermark : options.buffer_capacity / 5;
    return options;
}

OrbitOptions Configuration::makeOrbitOptions() const {
    OrbitOptions options;
    options.altitude_km = config_.orbit.altitude_km.get();
    options.inclination_deg = config_.orbit.inclination_deg.get();
    options.ground_lat_deg = config_.orbit.ground_lat_deg.get();
    options.ground_lon_deg = config_.orbit.ground_lon_deg.get();
    return options;
}

LinkBudgetOptions Configuration::makeLinkBudgetOptions() const {
    LinkBudgetOptions options;
    options.carrier_frequency = config_.link.carrier_frequency.get();
    options.tx_power_dbw = config_.link.tx_power_dbw.get();
    options.tx_gain_dbi = config_.link.tx_gain_dbi.get();
    options.rx_gain_dbi = config_.link.rx_gain_dbi.get();
    options.system_temp_k = config_.link.system_temp_k.get();
    options.bandwidth_hz = config_.link.bandwidth_hz.get();
    return options;
}

SimulationOptions Configuration::makeSimulationOptions() const {
    SimulationOptions options;
    options.duration = config_.simulation.duration.get();
    options.time_step = config_.simulation.time_step.get();
    options.min_elevation_deg = config_.simulation.min_elevation_deg.get();
    options.seed = config_.simulation.seed.get();
    options.refill_interval = config_.simulation.refill_interval.get();
    options.refill_count = config_.simulation.refill_count.get();
    options.refill_fraction = config_.simulation.refill_fraction.get();
    options.resync_interval = config_.simulation.resync_interval.get();
    options.jam_enabled = config_.jamming.enabled.get();
    options.jam_channel = config_.jamming.channel.get();
    options.jam_start = config_.jamming.start.get();
    options.jam_duration = config_.jamming.duration.get();
    options.doppler_compensation = config_.hop.doppler_compensation.get();
    options.source = makeSourceOptions();
    options.participant = makeParticipantOptions();
    options.orbit = makeOrbitOptions();
    options.link = makeLinkBudgetOptions();
    return options;
}

bool Configuration::validate() const {
    validation_errors_.clear();

    // Time stepping
    if (config_.simulation.duration.get() <= 0.0) {
        validation_errors_.push_back("Simulation duration must be positive");
    }
    if (config_.simulation.time_step.get() <= 0.0) {
        validation_errors_.push_back("Time step must be positive");
    }
    if (config_.hop.hop_duration.get() <= 0.0) {
        validation_errors_.push_back("Hop duration must be positive");
    }
    if (config_.simulation.refill_interval.get() < 1) {
        validation_errors_.push_back("Refill interval must be at least 1 tick");
    }
    if (config_.simulation.refill_count.get() < 0) {
        validation_errors_.push_back("Refill count cannot be negative");
    }
    if (config_.simulation.resync_interval.get() < 0.0) {
        validation_errors_.push_back("Resync interval cannot be negative");
    }

    // Frequency plan
    if (config_.source.num_channels.get() < 1) {
        validation_errors_.push_back("At least one pattern channel is required");
    }
    if (config_.source.num_frequencies.get() < 1) {
        validation_errors_.push_back("At least one frequency is required");
    }
    if (config_.source.min_frequency.get() >= config_.source.max_frequency.get()) {
        validation_errors_.push_back("Minimum frequency must be below maximum frequency");
    }
    if (config_.source.cache_size.get() < 1) {
        validation_errors_.push_back("Fallback cache size must be at least 1");
    }

    // Probabilities
    const double jam_p = config_.source.jam_probability.get();
    const double recovery_p = config_.source.recovery_probability.get();
    const double refill_fraction = config_.simulation.refill_fraction.get();
    if (jam_p < 0.0 || jam_p > 1.0) {
        validation_errors_.push_back("Jam probability must be between 0 and 1");
    }
    if (recovery_p < 0.0 || recovery_p > 1.0) {
        validation_errors_.push_back("Recovery probability must be between 0 and 1");
    }
    if (refill_fraction < 0.0 || refill_fraction > 1.0) {
        validation_errors_.push_back("Refill fraction must be between 0 and 1");
    }

    // Buffers
    if (config_.buffer.capacity.get() < 1) {
        validation_errors_.push_back("Buffer capacity must be at least 1");
    }
    if (config_.buffer.low_watermark.get() > config_.buffer.capacity.get()) {
        validation_errors_.push_back("Low watermark cannot exceed buffer capacity");
    }

    // Jamming window
    if (config_.jamming.enabled.get()) {
        const int channel = config_.jamming.channel.get();
        if (channel < 1 || channel > config_.source.num_channels.get()) {
            validation_errors_.push_back("Jam channel must be between 1 and the number of channels");
        }
        if (config_.jamming.duration.get() < 0.0) {
            validation_errors_.push_back("Jam duration cannot be negative");
        }
    }

    if (config_.link.bandwidth_hz.get() <= 0.0 || config_.link.system_temp_k.get() <= 0.0) {
        validation_errors_.push_back("Bandwidth and system temperature must be positive");
    }
    if (config_.orbit.altitude_km.get() <= 0.0) {
        validation_errors_.push_back("Orbit altitude must be positive");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace JitFhss
