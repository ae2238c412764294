#ifndef FLOTILLA_SRC_LAUNCHER_CENTRALIZED_LAUNCHER_H_
#define FLOTILLA_SRC_LAUNCHER_CENTRALIZED_LAUNCHER_H_

#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "launcher.h"

namespace Flotilla {

// Builds a worker's first-tier endpoint; the default is EndpointFactory::LaunchClient.
using ClientBuilder = std::function<ClientLaunch(const ClientOptions& options)>;

/**
 * Two-tier launch: a centralized broker aggregating the islands, one main
 * worker (the first core) that decides which testcases to keep, and
 * secondary workers on every other core. Needs a topology that can
 * duplicate the running process.
 */
class CentralizedLauncher {
	public:
		// main_callback may be empty; the main worker then runs secondary_callback.
		CentralizedLauncher(LaunchConfig config, ClientCallback secondary_callback,
				ClientCallback main_callback, Topology& topology, EndpointFactory& endpoints,
				std::shared_ptr<Monitor> monitor = nullptr);

		// LaunchGeneric with the factory's client endpoint for both kinds of worker.
		std::vector<ExitStatus> Launch();

		std::vector<ExitStatus> LaunchGeneric(ClientBuilder main_builder, ClientBuilder secondary_builder);

		const std::optional<Role>& role() const { return role_; }

	private:
		// Both return the exit code of the process they ran in.
		int RunCentralizedBroker();
		int RunClient(CoreId core, bool is_main, const ClientBuilder& builder);

		const LaunchConfig config_;
		OneShot<ClientCallback> secondary_callback_;
		OneShot<ClientCallback> main_callback_;
		Topology& topology_;
		EndpointFactory& endpoints_;
		std::shared_ptr<Monitor> monitor_;
		std::optional<Role> role_;
};

} // namespace Flotilla

#endif  // FLOTILLA_SRC_LAUNCHER_CENTRALIZED_LAUNCHER_H_
