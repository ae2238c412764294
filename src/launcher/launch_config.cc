#include "launch_config.h"

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>

#include <glog/logging.h>

#include "common/configuration.h"
#include "common/errors.h"

namespace Flotilla {

namespace {

uint16_t CheckedPort(int port, const char* what) {
	if (port < 1 || port > 65535) {
		throw ConfigError(std::string(what) + " " + std::to_string(port) + " is not a valid port");
	}
	return static_cast<uint16_t>(port);
}

std::optional<std::string> NonEmpty(const std::string& value) {
	if (value.empty()) {
		return std::nullopt;
	}
	return value;
}

ScopedFd CreateOutputFile(const std::string& path) {
	int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
	if (fd < 0) {
		int err = errno;
		LOG(ERROR) << "Cannot create output file " << path;
		throw ResourceError("Creating output file " + path, err);
	}
	return ScopedFd(fd);
}

} // namespace

void LaunchConfig::Validate(const std::vector<CoreId>& available) const {
	if (cores.empty()) {
		throw ConfigError("No cores to launch on");
	}
	for (const auto& core : cores.ids()) {
		if (std::find(available.begin(), available.end(), core) == available.end()) {
			throw ConfigError("Core " + std::to_string(core.id) + " is not available on this machine");
		}
	}
	if (broker_port == 0) {
		throw ConfigError("Broker port must not be 0");
	}
	if (centralized_broker_port == 0) {
		throw ConfigError("Centralized broker port must not be 0");
	}
}

LaunchConfig LaunchConfig::FromConfiguration(const FlotillaConfig& config) {
	LaunchConfig launch;
	launch.cores = Cores::FromCmdline(config.launcher.cores.get());
	launch.broker_port = CheckedPort(config.broker.port.get(), "Broker port");
	launch.centralized_broker_port = CheckedPort(config.broker.centralized_port.get(), "Centralized broker port");
	launch.launch_delay = std::chrono::milliseconds(config.launcher.launch_delay_ms.get());
	launch.stdout_file = NonEmpty(config.output.stdout_file.get());
	launch.stderr_file = NonEmpty(config.output.stderr_file.get());
	launch.spawn_broker = config.launcher.spawn_broker.get();
	launch.remote_broker_addr = NonEmpty(config.broker.remote_broker_addr.get());
	launch.bind_public = config.broker.bind_public.get();
	launch.client_timeout = std::chrono::milliseconds(config.broker.client_timeout_ms.get());
	launch.configuration = config.launcher.configuration.get();
	launch.serialize_state = ParseShouldSaveState(config.state.serialize.get());
	launch.time_ref = NonEmpty(config.state.time_ref.get());
	launch.always_interesting = config.centralized.always_interesting.get();
	launch.fail_on_client_error = config.launcher.fail_on_client_error.get();
	return launch;
}

OutputRedirection OutputRedirection::Open(const std::optional<std::string>& stdout_path,
		const std::optional<std::string>& stderr_path, bool debug_output) {
	OutputRedirection output;
	output.debug_output_ = debug_output;
	if (debug_output) {
		VLOG(1) << "Debug output requested, workers keep the launcher's stdio";
		return output;
	}
	if (stdout_path) {
		output.stdout_ = CreateOutputFile(*stdout_path);
	}
	// Without its own file stderr shares the stdout descriptor.
	if (stderr_path && (!stdout_path || *stderr_path != *stdout_path)) {
		output.stderr_ = CreateOutputFile(*stderr_path);
	}
	return output;
}

OutputRedirection OutputRedirection::Open(const LaunchConfig& config, bool debug_output) {
	return Open(config.stdout_file, config.stderr_file, debug_output);
}

void OutputRedirection::Apply() const {
	if (!enabled()) {
		return;
	}
	if (stdout_fd() >= 0 && ::dup2(stdout_fd(), STDOUT_FILENO) < 0) {
		throw ResourceError::FromErrno("Redirecting stdout");
	}
	if (stderr_fd() >= 0 && ::dup2(stderr_fd(), STDERR_FILENO) < 0) {
		throw ResourceError::FromErrno("Redirecting stderr");
	}
}

} // namespace Flotilla
