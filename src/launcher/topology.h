#ifndef FLOTILLA_SRC_LAUNCHER_TOPOLOGY_H_
#define FLOTILLA_SRC_LAUNCHER_TOPOLOGY_H_

#include <sys/types.h>

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <ostream>
#include <variant>
#include <vector>

#include "common/core_affinity.h"

namespace Flotilla {

class OutputRedirection;
class ShMemProvider;

/**
 * Move-only owner of a spawned process id. Destroying a handle neither
 * signals nor reaps the process.
 */
class ProcessHandle {
	public:
		ProcessHandle() = default;
		ProcessHandle(pid_t pid, CoreId core) : pid_(pid), core_(core) {}

		ProcessHandle(const ProcessHandle&) = delete;
		ProcessHandle& operator=(const ProcessHandle&) = delete;

		ProcessHandle(ProcessHandle&& o) noexcept : pid_(o.pid_), core_(o.core_) { o.pid_ = -1; }
		ProcessHandle& operator=(ProcessHandle&& o) noexcept {
			pid_ = o.pid_;
			core_ = o.core_;
			o.pid_ = -1;
			return *this;
		}

		pid_t pid() const { return pid_; }
		// Core of the worker; meaningless for broker processes.
		CoreId core() const { return core_; }
		bool valid() const { return pid_ > 0; }

	private:
		pid_t pid_ = -1;
		CoreId core_;
};

struct ExitStatus {
	pid_t pid = -1;
	CoreId core;
	bool exited = false;  // false: killed by a signal
	int code = 0;
	int signal = 0;

	bool success() const { return exited && code == 0; }

	// Decodes a waitpid() status word.
	static ExitStatus FromWaitStatus(pid_t pid, CoreId core, int status);
};

std::ostream& operator<<(std::ostream& os, const ExitStatus& status);

struct SpawnRequest {
	CoreId core;
	// 1-based position in the launch order; the worker starts after
	// stagger_index * launch_delay.
	size_t stagger_index = 1;
	std::chrono::milliseconds launch_delay{0};
	const OutputRedirection* output = nullptr;
};

struct SpawnedParent {
	ProcessHandle handle;
};

// This process is the new worker and must never return into the caller's
// parent logic.
struct SpawnedChild {};

using SpawnResult = std::variant<SpawnedParent, SpawnedChild>;

/**
 * How worker processes come to exist. The launchers only see this
 * interface; ForkTopology duplicates the running process, ReexecTopology
 * starts the executable again with an environment marker.
 */
class Topology {
	public:
		virtual ~Topology() = default;

		// Whether Duplicate() is available (needed for the centralized broker).
		virtual bool SupportsDuplication() const = 0;

		// Cores a worker may be bound to.
		virtual std::vector<CoreId> AvailableCores() const { return GetCoreIds(); }

		/**
		 * The core this process was started for when it is a re-executed
		 * worker, nullopt for the launching process. Throws ConfigError if the
		 * environment marker is present but malformed.
		 */
		virtual std::optional<CoreId> InheritedCore() const = 0;

		// Creates the worker for request.core.
		virtual SpawnResult Spawn(const SpawnRequest& request) = 0;

		// Plain duplication of this process, used for helper processes.
		virtual SpawnResult Duplicate() = 0;

		// Waits for every handle; the handles are consumed.
		virtual std::vector<ExitStatus> AwaitAll(std::vector<ProcessHandle>& handles) = 0;

		// Signals every handle once. Failures are logged, never thrown.
		virtual void SignalShutdown(std::vector<ProcessHandle>& handles) = 0;

		// Ends the calling process with code; never returns.
		[[noreturn]] virtual void ExitProcess(int code) = 0;
};

// ForkTopology when built with FLOTILLA_USE_FORK, ReexecTopology otherwise.
std::unique_ptr<Topology> MakeDefaultTopology(ShMemProvider& provider);

} // namespace Flotilla

#endif  // FLOTILLA_SRC_LAUNCHER_TOPOLOGY_H_
