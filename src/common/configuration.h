#ifndef FLOTILLA_CONFIGURATION_H_
#define FLOTILLA_CONFIGURATION_H_

#include <string>
#include <memory>
#include <optional>
#include <vector>
#include <cstdint>

#include <cxxopts.hpp>

namespace YAML {
class Node;
}

namespace Flotilla {

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
struct FlotillaConfig {
    // Which cores get a worker and how workers are started
    struct Launcher {
        ConfigValue<std::string> cores{"0", "FLOTILLA_CORES"};
        ConfigValue<size_t> launch_delay_ms{10, "FLOTILLA_LAUNCH_DELAY_MS"};
        ConfigValue<bool> spawn_broker{true, "FLOTILLA_SPAWN_BROKER"};
        ConfigValue<bool> centralized{false, "FLOTILLA_CENTRALIZED"};
        // Turns non-zero worker exits into a failed launch (informational otherwise)
        ConfigValue<bool> fail_on_client_error{false, "FLOTILLA_FAIL_ON_CLIENT_ERROR"};
        // Cluster tag; clients only accept events from peers with the same tag
        ConfigValue<std::string> configuration{"default", "FLOTILLA_CONFIGURATION"};
    } launcher;

    struct Broker {
        ConfigValue<int> port{1337, "FLOTILLA_BROKER_PORT"};
        ConfigValue<int> centralized_port{1338, "FLOTILLA_CENTRALIZED_BROKER_PORT"};
        // host:port of a broker on another machine to bridge to; empty for none
        ConfigValue<std::string> remote_broker_addr{"", "FLOTILLA_REMOTE_BROKER"};
        ConfigValue<bool> bind_public{false, "FLOTILLA_BIND_PUBLIC"};
        ConfigValue<int> client_timeout_ms{60000, "FLOTILLA_CLIENT_TIMEOUT_MS"};
    } broker;

    struct Centralized {
        ConfigValue<bool> always_interesting{false, "FLOTILLA_ALWAYS_INTERESTING"};
    } centralized;

    // Worker stdout/stderr; empty means not redirected
    struct Output {
        ConfigValue<std::string> stdout_file{"", "FLOTILLA_STDOUT_FILE"};
        ConfigValue<std::string> stderr_file{"", "FLOTILLA_STDERR_FILE"};
    } output;

    struct State {
        // always | on_restart | never
        ConfigValue<std::string> serialize{"on_restart", "FLOTILLA_SERIALIZE_STATE"};
        ConfigValue<size_t> slot_size{1UL << 20, "FLOTILLA_STATE_SLOT_SIZE"};
        // Name of the time observer driving adaptive serialization; empty for none
        ConfigValue<std::string> time_ref{"", "FLOTILLA_TIME_REF"};
    } state;

    // Built-in demo worker
    struct Demo {
        ConfigValue<size_t> iterations{100000, "FLOTILLA_DEMO_ITERATIONS"};
    } demo;
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

    // Command line surface of the flotilla binary
    static cxxopts::Options buildOptions();

    // Override with parsed command line arguments; false if --config could not be loaded
    bool overrideFromCommandLine(const cxxopts::ParseResult& arguments);

    // Get the configuration
    const FlotillaConfig& config() const { return config_; }
    FlotillaConfig& config() { return config_; }

    // Drop every file/command line value and go back to defaults
    void reset() { config_ = FlotillaConfig(); validation_errors_.clear(); }

    // Helper methods for common access patterns
    int getBrokerPort() const { return config_.broker.port.get(); }
    int getCentralizedBrokerPort() const { return config_.broker.centralized_port.get(); }
    size_t getLaunchDelayMs() const { return config_.launcher.launch_delay_ms.get(); }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    FlotillaConfig config_;
    mutable std::vector<std::string> validation_errors_;

    // Helper methods for parsing
    bool loadFromYaml(const YAML::Node& yaml);
    bool validateConfig();
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

} // namespace Flotilla

#endif // FLOTILLA_CONFIGURATION_H_
