#ifndef FLOTILLA_SRC_LAUNCHER_LAUNCHER_H_
#define FLOTILLA_SRC_LAUNCHER_LAUNCHER_H_

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "launch_config.h"
#include "one_shot.h"
#include "role.h"
#include "topology.h"
#include "transport/endpoint_builder.h"
#include "transport/monitor.h"

namespace Flotilla {

/**
 * A worker's body. Gets the state its previous incarnation saved (if any),
 * its endpoint and its core, and returns the process exit code.
 */
using ClientCallback = std::function<int(std::optional<std::string> state,
		std::unique_ptr<EventManager> manager, CoreId core)>;

/**
 * Stands up one broker and one worker per core, then blocks until the
 * campaign ends.
 */
class Launcher {
	public:
		Launcher(LaunchConfig config, ClientCallback callback, Topology& topology,
				EndpointFactory& endpoints, std::shared_ptr<Monitor> monitor = nullptr);

		/**
		 * Runs the campaign. In the launching process this returns once the
		 * broker finished (empty result) or, without a broker, once every
		 * worker exited (their statuses). In a worker process it never returns.
		 * Throws ConfigError before anything is spawned when the configuration
		 * or callback is unusable, ResourceError when spawning fails, and
		 * LaunchError for failed workers with fail_on_client_error.
		 */
		std::vector<ExitStatus> Launch();

		// Set once this process knows its part in the cluster.
		const std::optional<Role>& role() const { return role_; }

	private:
		// Runs the callback in a worker and returns its exit code.
		int RunClient(CoreId core);

		const LaunchConfig config_;
		OneShot<ClientCallback> callback_;
		Topology& topology_;
		EndpointFactory& endpoints_;
		std::shared_ptr<Monitor> monitor_;
		std::optional<Role> role_;
};

/**
 * Parent side of every launch once the workers exist: runs the broker until
 * one disconnect per core, then signals every handle; or, without a broker,
 * waits for every handle. If the broker throws, the handles are signaled
 * before the error propagates.
 */
std::vector<ExitStatus> RunBrokerOrWait(const LaunchConfig& config, Topology& topology,
		EndpointFactory& endpoints, const std::shared_ptr<Monitor>& monitor,
		std::vector<ProcessHandle>& handles);

/**
 * Spawns one worker. If the topology fails in the launching process, the
 * processes already in handles are signaled before the error propagates. A
 * failure on the worker side of a fork only propagates in that worker.
 */
SpawnResult SpawnOrStop(Topology& topology, const SpawnRequest& request,
		std::vector<ProcessHandle>& handles);

// ClientOptions for a worker on core.
ClientOptions MakeClientOptions(const LaunchConfig& config, CoreId core, ClientKind kind);

} // namespace Flotilla

#endif  // FLOTILLA_SRC_LAUNCHER_LAUNCHER_H_
