#ifndef ISINGSIM_CONFIGURATION_H_
#define ISINGSIM_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

namespace IsingSim {

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
struct IsingSimConfig {
    // Lattice and hot loop
    struct Simulation {
        ConfigValue<int> graph_size{512, "ISINGSIM_GRAPH_SIZE"};
        ConfigValue<bool> continuous{false, "ISINGSIM_CONTINUOUS"};
        ConfigValue<bool> weighted{true, "ISINGSIM_WEIGHTED"};
        ConfigValue<double> initial_temperature{1.0, "ISINGSIM_INITIAL_TEMPERATURE"};
        // 0 draws a seed from std::random_device
        ConfigValue<size_t> seed{0, "ISINGSIM_SEED"};
    } simulation;

    // External frame-tick driver
    struct Driver {
        ConfigValue<int> frame_rate{60, "ISINGSIM_FRAME_RATE"};
        ConfigValue<int> duration_s{10, "ISINGSIM_DURATION_S"};
        ConfigValue<int> worker_threads{3, "ISINGSIM_WORKER_THREADS"};
    } driver;

    struct Stats {
        ConfigValue<int> window{60, "ISINGSIM_STATS_WINDOW"};
    } stats;

    // Temperature sweep defaults, mirrors the interactive sweep dialog
    struct Sweep {
        ConfigValue<double> t_initial{1.0, "ISINGSIM_SWEEP_T_INITIAL"};
        ConfigValue<double> t_final{13.0, "ISINGSIM_SWEEP_T_FINAL"};
        ConfigValue<double> t_step{0.5, "ISINGSIM_SWEEP_T_STEP"};
        ConfigValue<int> sample_points{12, "ISINGSIM_SWEEP_SAMPLE_POINTS"};
        ConfigValue<int> sample_wait_ms{5000, "ISINGSIM_SWEEP_SAMPLE_WAIT_MS"};
        ConfigValue<int> step_wait_ms{0, "ISINGSIM_SWEEP_STEP_WAIT_MS"};
        ConfigValue<int> equilibration_wait_ms{0, "ISINGSIM_SWEEP_EQUILIBRATION_WAIT_MS"};
        ConfigValue<bool> save_snapshots{true, "ISINGSIM_SWEEP_SAVE_SNAPSHOTS"};
        ConfigValue<bool> reinitialize_first{false, "ISINGSIM_SWEEP_REINITIALIZE"};
    } sweep;

    struct Analysis {
        ConfigValue<int> max_distance{32, "ISINGSIM_ANALYSIS_MAX_DISTANCE"};
        ConfigValue<int> pairs_per_distance{4096, "ISINGSIM_ANALYSIS_PAIRS"};
    } analysis;

    struct Output {
        ConfigValue<std::string> snapshot_dir{"Images", "ISINGSIM_SNAPSHOT_DIR"};
    } output;
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
    const IsingSimConfig& config() const { return config_; }
    IsingSimConfig& config() { return config_; }

    // Helper methods for common access patterns
    int getGraphSize() const { return config_.simulation.graph_size.get(); }
    int getFrameRate() const { return config_.driver.frame_rate.get(); }
    int getStatsWindow() const { return config_.stats.window.get(); }

    // Restore every value to its compiled-in default
    void reset() { config_ = IsingSimConfig{}; validation_errors_.clear(); }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    IsingSimConfig config_;
    mutable std::vector<std::string> validation_errors_;

    // Shared by loadFromFile and loadFromString; takes a YAML::Node
    void parseYAMLNode(const void* node);
};

// Global accessor used by the binary
const Configuration& GetConfig();

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

} // namespace IsingSim

#endif // ISINGSIM_CONFIGURATION_H_
