#ifndef FLOTILLA_SRC_LAUNCHER_FORK_TOPOLOGY_H_
#define FLOTILLA_SRC_LAUNCHER_FORK_TOPOLOGY_H_

#include <sys/types.h>

#include "shmem/shmem_provider.h"
#include "topology.h"

namespace Flotilla {

/**
 * fork() bracketed by the provider's PreFork()/PostFork() hooks. Returns 0
 * in the child and the child's pid in the parent. Throws ResourceError if
 * fork() fails. Nothing else in Flotilla calls fork().
 */
pid_t DuplicateProcess(ShMemProvider& provider);

/**
 * Workers are copies of the launching process. The child sleeps out its
 * stagger slot and redirects its output before it returns SpawnedChild.
 * Shutdown sends SIGINT.
 */
class ForkTopology : public Topology {
	public:
		explicit ForkTopology(ShMemProvider& provider) : provider_(provider) {}

		bool SupportsDuplication() const override { return true; }
		std::optional<CoreId> InheritedCore() const override { return std::nullopt; }

		SpawnResult Spawn(const SpawnRequest& request) override;
		SpawnResult Duplicate() override;
		std::vector<ExitStatus> AwaitAll(std::vector<ProcessHandle>& handles) override;
		void SignalShutdown(std::vector<ProcessHandle>& handles) override;
		[[noreturn]] void ExitProcess(int code) override;

	private:
		ShMemProvider& provider_;
};

// Blocking waitpid() on every handle; shared by the topologies.
std::vector<ExitStatus> WaitForHandles(std::vector<ProcessHandle>& handles);

// Sends sig to every handle, logging the failures.
void SignalHandles(std::vector<ProcessHandle>& handles, int sig);

// Flushes logs and stdio, then _exit()s without running atexit handlers.
[[noreturn]] void FlushAndExit(int code);

} // namespace Flotilla

#endif  // FLOTILLA_SRC_LAUNCHER_FORK_TOPOLOGY_H_
