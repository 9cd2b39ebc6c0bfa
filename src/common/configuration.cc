#include "configuration.h"
#include "env_flags.h"
#include <cstdlib>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace IsingSim {

// Global function to get configuration instance
const Configuration& GetConfig() {
    return Configuration::getInstance();
}

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
        if (IsEnvTrueValue(env_val)) {
            return true;
        } else if (IsEnvFalseValue(env_val)) {
            return false;
        }
        LOG(WARNING) << "Invalid boolean value for env var " << env_var_ << ": " << env_val;
    }
    return std::nullopt;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

void Configuration::parseYAMLNode(const void* node) {
    const YAML::Node& yaml = *static_cast<const YAML::Node*>(node);
    if (!yaml["isingsim"]) {
        LOG(WARNING) << "Configuration has no top-level 'isingsim' section, keeping defaults";
        return;
    }
    auto root = yaml["isingsim"];

    // Simulation
    if (root["simulation"]) {
        auto sim = root["simulation"];
        if (sim["graph_size"]) config_.simulation.graph_size.set(sim["graph_size"].as<int>());
        if (sim["continuous"]) config_.simulation.continuous.set(sim["continuous"].as<bool>());
        if (sim["weighted"]) config_.simulation.weighted.set(sim["weighted"].as<bool>());
        if (sim["initial_temperature"]) config_.simulation.initial_temperature.set(sim["initial_temperature"].as<double>());
        if (sim["seed"]) config_.simulation.seed.set(sim["seed"].as<size_t>());
    }

    // Driver
    if (root["driver"]) {
        auto driver = root["driver"];
        if (driver["frame_rate"]) config_.driver.frame_rate.set(driver["frame_rate"].as<int>());
        if (driver["duration_s"]) config_.driver.duration_s.set(driver["duration_s"].as<int>());
        if (driver["worker_threads"]) config_.driver.worker_threads.set(driver["worker_threads"].as<int>());
    }

    // Stats
    if (root["stats"]) {
        auto stats = root["stats"];
        if (stats["window"]) config_.stats.window.set(stats["window"].as<int>());
    }

    // Sweep
    if (root["sweep"]) {
        auto sweep = root["sweep"];
        if (sweep["t_initial"]) config_.sweep.t_initial.set(sweep["t_initial"].as<double>());
        if (sweep["t_final"]) config_.sweep.t_final.set(sweep["t_final"].as<double>());
        if (sweep["t_step"]) config_.sweep.t_step.set(sweep["t_step"].as<double>());
        if (sweep["sample_points"]) config_.sweep.sample_points.set(sweep["sample_points"].as<int>());
        if (sweep["sample_wait_ms"]) config_.sweep.sample_wait_ms.set(sweep["sample_wait_ms"].as<int>());
        if (sweep["step_wait_ms"]) config_.sweep.step_wait_ms.set(sweep["step_wait_ms"].as<int>());
        if (sweep["equilibration_wait_ms"]) config_.sweep.equilibration_wait_ms.set(sweep["equilibration_wait_ms"].as<int>());
        if (sweep["save_snapshots"]) config_.sweep.save_snapshots.set(sweep["save_snapshots"].as<bool>());
        if (sweep["reinitialize_first"]) config_.sweep.reinitialize_first.set(sweep["reinitialize_first"].as<bool>());
    }

    // Analysis
    if (root["analysis"]) {
        auto analysis = root["analysis"];
        if (analysis["max_distance"]) config_.analysis.max_distance.set(analysis["max_distance"].as<int>());
        if (analysis["pairs_per_distance"]) config_.analysis.pairs_per_distance.set(analysis["pairs_per_distance"].as<int>());
    }

    // Output
    if (root["output"]) {
        auto output = root["output"];
        if (output["snapshot_dir"]) config_.output.snapshot_dir.set(output["snapshot_dir"].as<std::string>());
    }
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        parseYAMLNode(&yaml);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        parseYAMLNode(&yaml);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

bool Configuration::validate() const {
    validation_errors_.clear();

    const int graph_size = config_.simulation.graph_size.get();
    if (graph_size < 4) {
        validation_errors_.push_back("Graph size must be at least 4");
    }

    if (config_.stats.window.get() < 1) {
        validation_errors_.push_back("Stats window must be at least 1");
    }

    // Driver
    if (config_.driver.frame_rate.get() <= 0) {
        validation_errors_.push_back("Frame rate must be positive");
    }
    if (config_.driver.worker_threads.get() < 1) {
        validation_errors_.push_back("Worker threads must be at least 1");
    }
    if (config_.driver.duration_s.get() < 0) {
        validation_errors_.push_back("Duration cannot be negative");
    }

    // Sweep bounds are checked again when a sweep is launched
    if (config_.sweep.t_step.get() <= 0.0) {
        validation_errors_.push_back("Sweep temperature step must be positive");
    }
    if (config_.sweep.sample_points.get() < 0) {
        validation_errors_.push_back("Sweep sample points cannot be negative");
    }
    if (config_.sweep.sample_wait_ms.get() < 0 || config_.sweep.step_wait_ms.get() < 0 ||
        config_.sweep.equilibration_wait_ms.get() < 0) {
        validation_errors_.push_back("Sweep waits cannot be negative");
    }

    const int max_distance = config_.analysis.max_distance.get();
    if (max_distance < 1 || max_distance > graph_size / 2) {
        validation_errors_.push_back("Analysis max distance must be between 1 and graph_size/2");
    }
    if (config_.analysis.pairs_per_distance.get() < 1) {
        validation_errors_.push_back("Analysis pairs per distance must be at least 1");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace IsingSim
