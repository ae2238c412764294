#ifndef FLOTILLA_SRC_LAUNCHER_REEXEC_TOPOLOGY_H_
#define FLOTILLA_SRC_LAUNCHER_REEXEC_TOPOLOGY_H_

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "topology.h"

namespace Flotilla {

/**
 * Workers are fresh runs of the same executable with the same arguments.
 * FLOTILLA_LAUNCHER_CLIENT tells the new process which core it serves. The
 * parent spawns worker k once k launch delays have passed since the first
 * spawn of the launch (stagger index 1). Shutdown sends SIGKILL and reaps
 * the workers.
 */
class ReexecTopology : public Topology {
	public:
		// Re-runs /proc/self/exe with this process's own arguments.
		ReexecTopology();
		ReexecTopology(std::string program, std::vector<std::string> argv);

		bool SupportsDuplication() const override { return false; }
		std::optional<CoreId> InheritedCore() const override;

		SpawnResult Spawn(const SpawnRequest& request) override;
		// Throws std::logic_error; a re-executed process cannot continue the caller.
		SpawnResult Duplicate() override;
		std::vector<ExitStatus> AwaitAll(std::vector<ProcessHandle>& handles) override;
		void SignalShutdown(std::vector<ProcessHandle>& handles) override;
		[[noreturn]] void ExitProcess(int code) override;

		/**
		 * Parses a marker value: a non-negative decimal core index. Throws
		 * ConfigError for anything else.
		 */
		static CoreId ParseMarker(const std::string& value);

		const std::string& program() const { return program_; }
		const std::vector<std::string>& argv() const { return argv_; }

	private:
		std::vector<std::string> ChildEnvironment(CoreId core) const;

		std::string program_;
		std::vector<std::string> argv_;
		std::optional<std::chrono::steady_clock::time_point> launch_start_;
};

} // namespace Flotilla

#endif  // FLOTILLA_SRC_LAUNCHER_REEXEC_TOPOLOGY_H_
