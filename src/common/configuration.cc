#include "configuration.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Flotilla {

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
        std::transform(val.begin(), val.end(), val.begin(),
                [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (val == "true" || val == "1" || val == "yes" || val == "on") {
            return true;
        } else if (val == "false" || val == "0" || val == "no" || val == "off") {
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

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        return loadFromYaml(yaml);
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        return loadFromYaml(yaml);
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

bool Configuration::loadFromYaml(const YAML::Node& yaml) {
    if (yaml["flotilla"]) {
        auto root = yaml["flotilla"];

        // Launcher
        if (root["launcher"]) {
            auto launcher = root["launcher"];
            if (launcher["cores"]) config_.launcher.cores.set(launcher["cores"].as<std::string>());
            if (launcher["launch_delay_ms"]) config_.launcher.launch_delay_ms.set(launcher["launch_delay_ms"].as<size_t>());
            if (launcher["spawn_broker"]) config_.launcher.spawn_broker.set(launcher["spawn_broker"].as<bool>());
            if (launcher["centralized"]) config_.launcher.centralized.set(launcher["centralized"].as<bool>());
            if (launcher["fail_on_client_error"]) config_.launcher.fail_on_client_error.set(launcher["fail_on_client_error"].as<bool>());
            if (launcher["configuration"]) config_.launcher.configuration.set(launcher["configuration"].as<std::string>());
        }

        // Broker
        if (root["broker"]) {
            auto broker = root["broker"];
            if (broker["port"]) config_.broker.port.set(broker["port"].as<int>());
            if (broker["centralized_port"]) config_.broker.centralized_port.set(broker["centralized_port"].as<int>());
            if (broker["remote_broker_addr"]) config_.broker.remote_broker_addr.set(broker["remote_broker_addr"].as<std::string>());
            if (broker["bind_public"]) config_.broker.bind_public.set(broker["bind_public"].as<bool>());
            if (broker["client_timeout_ms"]) config_.broker.client_timeout_ms.set(broker["client_timeout_ms"].as<int>());
        }

        // Centralized
        if (root["centralized"]) {
            auto centralized = root["centralized"];
            if (centralized["always_interesting"]) config_.centralized.always_interesting.set(centralized["always_interesting"].as<bool>());
        }

        // Output
        if (root["output"]) {
            auto output = root["output"];
            if (output["stdout_file"]) config_.output.stdout_file.set(output["stdout_file"].as<std::string>());
            if (output["stderr_file"]) config_.output.stderr_file.set(output["stderr_file"].as<std::string>());
        }

        // State
        if (root["state"]) {
            auto state = root["state"];
            if (state["serialize"]) config_.state.serialize.set(state["serialize"].as<std::string>());
            if (state["slot_size"]) config_.state.slot_size.set(state["slot_size"].as<size_t>());
            if (state["time_ref"]) config_.state.time_ref.set(state["time_ref"].as<std::string>());
        }

        // Demo
        if (root["demo"]) {
            auto demo = root["demo"];
            if (demo["iterations"]) config_.demo.iterations.set(demo["iterations"].as<size_t>());
        }
    }

    return validateConfig();
}

cxxopts::Options Configuration::buildOptions() {
    cxxopts::Options options("flotilla", "Launches a broker and one fuzzing worker per core");

    options.add_options()
        ("c,cores", "Cores to bind workers to, e.g. 0,2-4 or all", cxxopts::value<std::string>())
        ("p,broker_port", "Broker port (or port to attach to with --no_broker)", cxxopts::value<int>())
        ("centralized_port", "Centralized broker port", cxxopts::value<int>())
        ("d,launch_delay", "Milliseconds between worker launches", cxxopts::value<size_t>())
        ("no_broker", "Attach workers to an already running broker")
        ("r,remote_broker", "host:port of a broker on another machine", cxxopts::value<std::string>())
        ("o,stdout", "File receiving worker stdout", cxxopts::value<std::string>())
        ("e,stderr", "File receiving worker stderr (defaults to --stdout)", cxxopts::value<std::string>())
        ("centralized", "Run the two-tier topology with one main worker")
        ("always_interesting", "Main worker accepts every forwarded testcase")
        ("serialize_state", "always, on_restart or never", cxxopts::value<std::string>())
        ("configuration", "Cluster configuration tag", cxxopts::value<std::string>())
        ("fail_on_client_error", "Fail the launch when a worker exits non-zero")
        ("iterations", "Executions per demo worker", cxxopts::value<size_t>())
        ("f,config", "YAML configuration file", cxxopts::value<std::string>())
        ("l,log_level", "Log level", cxxopts::value<int>()->default_value("0"))
        ("h,help", "Print usage");

    return options;
}

bool Configuration::overrideFromCommandLine(const cxxopts::ParseResult& arguments) {
    // The file goes first so explicit flags win over it
    if (arguments.count("config") && !loadFromFile(arguments["config"].as<std::string>())) {
        return false;
    }
    if (arguments.count("cores")) config_.launcher.cores.set(arguments["cores"].as<std::string>());
    if (arguments.count("broker_port")) config_.broker.port.set(arguments["broker_port"].as<int>());
    if (arguments.count("centralized_port")) config_.broker.centralized_port.set(arguments["centralized_port"].as<int>());
    if (arguments.count("launch_delay")) config_.launcher.launch_delay_ms.set(arguments["launch_delay"].as<size_t>());
    if (arguments.count("no_broker")) config_.launcher.spawn_broker.set(false);
    if (arguments.count("remote_broker")) config_.broker.remote_broker_addr.set(arguments["remote_broker"].as<std::string>());
    if (arguments.count("stdout")) config_.output.stdout_file.set(arguments["stdout"].as<std::string>());
    if (arguments.count("stderr")) config_.output.stderr_file.set(arguments["stderr"].as<std::string>());
    if (arguments.count("centralized")) config_.launcher.centralized.set(true);
    if (arguments.count("always_interesting")) config_.centralized.always_interesting.set(true);
    if (arguments.count("serialize_state")) config_.state.serialize.set(arguments["serialize_state"].as<std::string>());
    if (arguments.count("configuration")) config_.launcher.configuration.set(arguments["configuration"].as<std::string>());
    if (arguments.count("fail_on_client_error")) config_.launcher.fail_on_client_error.set(true);
    if (arguments.count("iterations")) config_.demo.iterations.set(arguments["iterations"].as<size_t>());
    return true;
}

bool Configuration::validate() const {
    validation_errors_.clear();

    // Validate port ranges
    int port = config_.broker.port.get();
    int centralized_port = config_.broker.centralized_port.get();
    if (port < 1 || port > 65535) {
        validation_errors_.push_back("Broker port must be between 1 and 65535");
    }
    if (centralized_port < 1 || centralized_port > 65535) {
        validation_errors_.push_back("Centralized broker port must be between 1 and 65535");
    }
    if (config_.launcher.centralized.get() && port == centralized_port) {
        validation_errors_.push_back("Broker and centralized broker ports must differ");
    }

    if (config_.launcher.cores.get().empty()) {
        validation_errors_.push_back("Core list must not be empty");
    }

    const std::string serialize = config_.state.serialize.get();
    if (serialize != "always" && serialize != "on_restart" && serialize != "never") {
        validation_errors_.push_back("serialize must be one of always, on_restart, never");
    }

    if (config_.state.slot_size.get() < 4096) {
        validation_errors_.push_back("State slot size must be at least 4KB");
    }

    if (config_.broker.client_timeout_ms.get() < 1) {
        validation_errors_.push_back("Client timeout must be positive");
    }

    if (config_.launcher.configuration.get().empty()) {
        validation_errors_.push_back("Configuration tag must not be empty");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

bool Configuration::validateConfig() {
    bool ok = validate();
    for (const auto& err : validation_errors_) {
        LOG(ERROR) << "Invalid configuration: " << err;
    }
    return ok;
}

} // namespace Flotilla
