#ifndef FLOTILLA_SRC_LAUNCHER_LAUNCH_CONFIG_H_
#define FLOTILLA_SRC_LAUNCHER_LAUNCH_CONFIG_H_

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "common/config.h"
#include "common/core_affinity.h"
#include "common/scoped_fd.h"
#include "transport/event_config.h"

namespace Flotilla {

struct FlotillaConfig;

/**
 * Everything a launch needs. Built once at process entry and never changed
 * after Launch() starts.
 */
struct LaunchConfig {
	Cores cores;
	uint16_t broker_port = kDefaultBrokerPort;
	uint16_t centralized_broker_port = kDefaultCentralizedBrokerPort;
	std::chrono::milliseconds launch_delay{kDefaultLaunchDelayMs};
	std::optional<std::string> stdout_file;
	// Falls back to stdout_file when unset.
	std::optional<std::string> stderr_file;
	bool spawn_broker = true;
	std::optional<std::string> remote_broker_addr;
	bool bind_public = false;
	std::chrono::milliseconds client_timeout{kBrokerClientTimeoutMs};
	std::string configuration = "default";
	ShouldSaveState serialize_state = ShouldSaveState::OnRestart;
	std::optional<std::string> time_ref;
	// Centralized only: the main worker keeps every forwarded testcase.
	bool always_interesting = false;
	// Non-zero worker exits fail the launch instead of being logged only.
	bool fail_on_client_error = false;

	/**
	 * Throws ConfigError when the core set is empty, names a core not in
	 * available, or a port is zero.
	 */
	void Validate(const std::vector<CoreId>& available) const;

	// From a validated Configuration; throws ConfigError on malformed values.
	static LaunchConfig FromConfiguration(const FlotillaConfig& config);
};

/**
 * Worker stdout/stderr targets, opened once by the launching process and
 * kept open for its lifetime. With FLOTILLA_DEBUG_OUTPUT set nothing is
 * opened and every worker keeps the launcher's stdio.
 */
class OutputRedirection {
	public:
		OutputRedirection() = default;

		// Throws ResourceError if a file cannot be created.
		static OutputRedirection Open(const std::optional<std::string>& stdout_path,
				const std::optional<std::string>& stderr_path, bool debug_output);
		static OutputRedirection Open(const LaunchConfig& config, bool debug_output);

		OutputRedirection(OutputRedirection&&) = default;
		OutputRedirection& operator=(OutputRedirection&&) = default;

		bool debug_output() const { return debug_output_; }
		// Whether workers get their stdio replaced.
		bool enabled() const { return !debug_output_ && (stdout_.valid() || stderr_.valid()); }

		// -1 when the stream is not redirected.
		int stdout_fd() const { return stdout_.get(); }
		int stderr_fd() const { return stderr_.valid() ? stderr_.get() : stdout_.get(); }

		// Points fds 1 and 2 of the calling process at the targets. Throws ResourceError.
		void Apply() const;

	private:
		bool debug_output_ = false;
		ScopedFd stdout_;
		ScopedFd stderr_;
};

} // namespace Flotilla

#endif  // FLOTILLA_SRC_LAUNCHER_LAUNCH_CONFIG_H_
