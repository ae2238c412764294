#include "launcher.h"

#include <unistd.h>

#include <glog/logging.h>

#include "common/env_flags.h"
#include "common/errors.h"

namespace Flotilla {

ClientOptions MakeClientOptions(const LaunchConfig& config, CoreId core, ClientKind kind) {
	ClientOptions options;
	options.broker_port = config.broker_port;
	options.core = core;
	options.configuration = config.configuration;
	options.serialize_state = config.serialize_state;
	options.time_ref = config.time_ref;
	options.kind = kind;
	return options;
}

SpawnResult SpawnOrStop(Topology& topology, const SpawnRequest& request,
		std::vector<ProcessHandle>& handles) {
	const pid_t launcher_pid = getpid();
	try {
		return topology.Spawn(request);
	} catch (const LaunchError& e) {
		if (getpid() != launcher_pid) {
			// A worker that failed after the fork; the handles it inherited belong to the launcher.
			LOG(ERROR) << "Client on core " << request.core << " failed to start: " << e.what();
			throw;
		}
		LOG(ERROR) << "Spawning client on core " << request.core << " failed: " << e.what()
			<< ", stopping " << handles.size() << " processes";
		topology.SignalShutdown(handles);
		throw;
	}
}

std::vector<ExitStatus> RunBrokerOrWait(const LaunchConfig& config, Topology& topology,
		EndpointFactory& endpoints, const std::shared_ptr<Monitor>& monitor,
		std::vector<ProcessHandle>& handles) {
	if (!config.spawn_broker) {
		LOG(INFO) << "Not spawning broker, waiting for " << handles.size() << " processes";
		std::vector<ExitStatus> statuses = topology.AwaitAll(handles);
		size_t failed = 0;
		for (const auto& status : statuses) {
			if (!status.success()) {
				failed++;
				LOG(WARNING) << "Client " << status;
			}
		}
		if (failed > 0 && config.fail_on_client_error) {
			throw LaunchError(std::to_string(failed) + " of " + std::to_string(statuses.size())
					+ " processes failed");
		}
		return statuses;
	}

	BrokerOptions broker;
	broker.port = config.broker_port;
	broker.monitor = monitor;
	broker.remote_broker_addr = config.remote_broker_addr;
	broker.exit_cleanly_after = config.cores.size();
	broker.configuration = config.configuration;
	broker.serialize_state = config.serialize_state;
	broker.bind_public = config.bind_public;
	broker.client_timeout = config.client_timeout;

	try {
		endpoints.RunBroker(broker);
	} catch (const std::exception& e) {
		LOG(ERROR) << "Broker failed: " << e.what() << ", stopping " << handles.size() << " processes";
		topology.SignalShutdown(handles);
		throw;
	}

	LOG(INFO) << "Broker done, stopping " << handles.size() << " processes";
	topology.SignalShutdown(handles);
	return {};
}

Launcher::Launcher(LaunchConfig config, ClientCallback callback, Topology& topology,
		EndpointFactory& endpoints, std::shared_ptr<Monitor> monitor)
	: config_(std::move(config)),
	callback_(std::move(callback)),
	topology_(topology),
	endpoints_(endpoints),
	monitor_(std::move(monitor)) {}

std::vector<ExitStatus> Launcher::Launch() {
	if (!callback_.present()) {
		throw ConfigError("Launcher needs a client callback");
	}
	config_.Validate(topology_.AvailableCores());

	// A re-executed worker learns its core from the environment.
	if (auto inherited = topology_.InheritedCore()) {
		if (!config_.cores.Contains(*inherited)) {
			throw ConfigError("Inherited core " + std::to_string(inherited->id) + " is not in " + config_.cores.ToString());
		}
		role_ = ClientRole{*inherited};
		topology_.ExitProcess(RunClient(*inherited));
	}

	LOG(INFO) << "Spawning " << config_.cores.size() << " clients on cores " << config_.cores;
	OutputRedirection output = OutputRedirection::Open(config_, DebugOutputRequested());

	std::vector<ProcessHandle> handles;
	size_t index = 0;
	for (const auto& core : config_.cores.ids()) {
		index++;
		SpawnRequest request;
		request.core = core;
		request.stagger_index = index;
		request.launch_delay = config_.launch_delay;
		request.output = &output;

		SpawnResult result = SpawnOrStop(topology_, request, handles);
		if (std::holds_alternative<SpawnedChild>(result)) {
			role_ = ClientRole{core};
			topology_.ExitProcess(RunClient(core));
		}
		handles.push_back(std::move(std::get<SpawnedParent>(result).handle));
	}

	if (config_.spawn_broker) {
		role_ = BrokerRole{};
	}
	return RunBrokerOrWait(config_, topology_, endpoints_, monitor_, handles);
}

int Launcher::RunClient(CoreId core) {
	ClientLaunch launch = endpoints_.LaunchClient(MakeClientOptions(config_, core, ClientKind::Client));
	ClientCallback callback = callback_.Take();
	int code = callback(std::move(launch.state), std::move(launch.manager), core);
	VLOG(1) << "Client on core " << core << " finished with " << code;
	return code;
}

} // namespace Flotilla
