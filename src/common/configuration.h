#ifndef JITFHSS_CONFIGURATION_H_
#define JITFHSS_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace YAML {
class Node;
}

namespace JitFhss {

struct PatternSourceOptions;
struct ParticipantOptions;
struct OrbitOptions;
struct LinkBudgetOptions;
struct SimulationOptions;

/**
 * Configuration value that can be overridden by environment variables
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), env_var_(env_var) {}

    T get() const {
        if (!env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    void set(T value) { value_ = value; }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

/**
 * Main configuration structure
 */
struct JitFhssConfig {
    // Time stepping of the driver loop
    struct Simulation {
        ConfigValue<double> duration{1000.0, "JITFHSS_SIM_DURATION"};
        ConfigValue<double> time_step{0.1, "JITFHSS_SIM_TIME_STEP"};
        ConfigValue<double> min_elevation_deg{5.0, "JITFHSS_SIM_MIN_ELEVATION"};
        // 0 draws a seed from std::random_device
        ConfigValue<size_t> seed{0, "JITFHSS_SIM_SEED"};
        ConfigValue<int> refill_interval{10, "JITFHSS_SIM_REFILL_INTERVAL"};
        ConfigValue<int> refill_count{10, "JITFHSS_SIM_REFILL_COUNT"};
        ConfigValue<double> refill_fraction{0.3, "JITFHSS_SIM_REFILL_FRACTION"};
        // Clock resynchronization period in seconds, 0 disables
        ConfigValue<double> resync_interval{0.0, "JITFHSS_SIM_RESYNC_INTERVAL"};
    } simulation;

    // Redundant pattern channels
    struct Source {
        ConfigValue<int> num_channels{3, "JITFHSS_SOURCE_CHANNELS"};
        ConfigValue<int> num_frequencies{100, "JITFHSS_SOURCE_FREQUENCIES"};
        ConfigValue<double> min_frequency{2.0e9, "JITFHSS_SOURCE_MIN_FREQ"};
        ConfigValue<double> max_frequency{2.1e9, "JITFHSS_SOURCE_MAX_FREQ"};
        ConfigValue<size_t> cache_size{1000, "JITFHSS_SOURCE_CACHE_SIZE"};
        ConfigValue<double> jam_probability{0.001, "JITFHSS_SOURCE_JAM_PROBABILITY"};
        ConfigValue<double> recovery_probability{0.1, "JITFHSS_SOURCE_RECOVERY_PROBABILITY"};
    } source;

    struct Buffer {
        ConfigValue<size_t> capacity{50, "JITFHSS_BUFFER_CAPACITY"};
        // Defaults to 20% of capacity when left at 0
        ConfigValue<size_t> low_watermark{0, "JITFHSS_BUFFER_LOW_WATERMARK"};
    } buffer;

    struct Hop {
        ConfigValue<double> hop_duration{1.0, "JITFHSS_HOP_DURATION"};
        ConfigValue<double> snr_threshold_db{8.0, "JITFHSS_HOP_SNR_THRESHOLD"};
        ConfigValue<bool> doppler_compensation{true, "JITFHSS_HOP_DOPPLER_COMPENSATION"};
    } hop;

    struct Orbit {
        ConfigValue<double> altitude_km{500.0, "JITFHSS_ORBIT_ALTITUDE"};
        ConfigValue<double> inclination_deg{45.0, "JITFHSS_ORBIT_INCLINATION"};
        ConfigValue<double> ground_lat_deg{22.0, "JITFHSS_ORBIT_GROUND_LAT"};
        ConfigValue<double> ground_lon_deg{21.5, "JITFHSS_ORBIT_GROUND_LON"};
    } orbit;

    struct Link {
        ConfigValue<double> carrier_frequency{2.05e9, "JITFHSS_LINK_CARRIER_FREQ"};
        ConfigValue<double> tx_power_dbw{10.0, "JITFHSS_LINK_TX_POWER"};
        ConfigValue<double> tx_gain_dbi{15.0, "JITFHSS_LINK_TX_GAIN"};
        ConfigValue<double> rx_gain_dbi{25.0, "JITFHSS_LINK_RX_GAIN"};
        ConfigValue<double> system_temp_k{290.0, "JITFHSS_LINK_SYSTEM_TEMP"};
        ConfigValue<double> bandwidth_hz{1.0e6, "JITFHSS_LINK_BANDWIDTH"};
    } link;

    // Administrative jamming window applied by the driver
    struct Jamming {
        ConfigValue<bool> enabled{true, "JITFHSS_JAM_ENABLED"};
        ConfigValue<int> channel{1, "JITFHSS_JAM_CHANNEL"};
        ConfigValue<double> start{400.0, "JITFHSS_JAM_START"};
        ConfigValue<double> duration{200.0, "JITFHSS_JAM_DURATION"};
    } jamming;
};

/**
 * Configuration manager singleton
 */
class Configuration {
public:
    static Configuration& getInstance();

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Get the configuration
    const JitFhssConfig& config() const { return config_; }
    JitFhssConfig& config() { return config_; }

    // Restore every value to its built-in default
    void resetToDefaults() { config_ = JitFhssConfig{}; }

    // Component options derived from the current values
    PatternSourceOptions makeSourceOptions() const;
    ParticipantOptions makeParticipantOptions() const;
    OrbitOptions makeOrbitOptions() const;
    LinkBudgetOptions makeLinkBudgetOptions() const;
    SimulationOptions makeSimulationOptions() const;

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    JitFhssConfig config_;
    mutable std::vector<std::string> validation_errors_;

    // Shared by loadFromFile and loadFromString
    void applyYAML(const YAML::Node& yaml);
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const;

template<>
std::optional<double> ConfigValue<double>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

} // namespace JitFhss

#endif // JITFHSS_CONFIGURATION_H_
