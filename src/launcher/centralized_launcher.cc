#include "centralized_launcher.h"

#include <chrono>
#include <thread>

#include <glog/logging.h>

#include "common/config.h"
#include "common/env_flags.h"
#include "common/errors.h"

namespace Flotilla {

CentralizedLauncher::CentralizedLauncher(LaunchConfig config, ClientCallback secondary_callback,
		ClientCallback main_callback, Topology& topology, EndpointFactory& endpoints,
		std::shared_ptr<Monitor> monitor)
	: config_(std::move(config)),
	secondary_callback_(std::move(secondary_callback)),
	main_callback_(std::move(main_callback)),
	topology_(topology),
	endpoints_(endpoints),
	monitor_(std::move(monitor)) {}

std::vector<ExitStatus> CentralizedLauncher::Launch() {
	auto standard = [this](const ClientOptions& options) {
		return endpoints_.LaunchClient(options);
	};
	return LaunchGeneric(standard, standard);
}

std::vector<ExitStatus> CentralizedLauncher::LaunchGeneric(ClientBuilder main_builder,
		ClientBuilder secondary_builder) {
	if (!secondary_callback_.present()) {
		throw ConfigError("Centralized launcher needs a secondary client callback");
	}
	if (!main_builder || !secondary_builder) {
		throw ConfigError("Centralized launcher needs main and secondary endpoint builders");
	}
	if (!topology_.SupportsDuplication()) {
		throw ConfigError("Centralized launch needs a topology that can duplicate the process");
	}
	config_.Validate(topology_.AvailableCores());
	if (config_.centralized_broker_port == config_.broker_port) {
		throw ConfigError("Broker and centralized broker share port " + std::to_string(config_.broker_port));
	}

	OutputRedirection output = OutputRedirection::Open(config_, DebugOutputRequested());
	std::vector<ProcessHandle> handles;

	SpawnResult centralized = topology_.Duplicate();
	if (std::holds_alternative<SpawnedChild>(centralized)) {
		role_ = CentralizedBrokerRole{};
		topology_.ExitProcess(RunCentralizedBroker());
	}
	handles.push_back(std::move(std::get<SpawnedParent>(centralized).handle));
	std::this_thread::sleep_for(std::chrono::milliseconds(kCentralizedBrokerBindPauseMs));

	LOG(INFO) << "Spawning main and " << config_.cores.size() - 1 << " secondary clients on cores " << config_.cores;
	size_t index = 0;
	for (const auto& core : config_.cores.ids()) {
		index++;
		bool is_main = index == 1;
		SpawnRequest request;
		request.core = core;
		request.stagger_index = index;
		request.launch_delay = config_.launch_delay;
		request.output = &output;

		SpawnResult result = SpawnOrStop(topology_, request, handles);
		if (std::holds_alternative<SpawnedChild>(result)) {
			if (is_main) {
				role_ = MainClientRole{core};
			} else {
				role_ = SecondaryClientRole{core};
			}
			topology_.ExitProcess(RunClient(core, is_main, is_main ? main_builder : secondary_builder));
		}
		handles.push_back(std::move(std::get<SpawnedParent>(result).handle));
	}

	if (config_.spawn_broker) {
		role_ = BrokerRole{};
	}
	return RunBrokerOrWait(config_, topology_, endpoints_, monitor_, handles);
}

int CentralizedLauncher::RunCentralizedBroker() {
	CentralizedBrokerOptions options;
	options.port = config_.centralized_broker_port;
	options.client_timeout = std::chrono::milliseconds(kCentralizedClientTimeoutMs);
	options.poll_interval = std::chrono::milliseconds(kCentralizedPollIntervalMs);
	endpoints_.RunCentralizedBroker(options);
	LOG(INFO) << "Centralized broker done";
	return kShuttingDownExitCode;
}

int CentralizedLauncher::RunClient(CoreId core, bool is_main, const ClientBuilder& builder) {
	ClientLaunch launch = builder(MakeClientOptions(config_, core,
				is_main ? ClientKind::Main : ClientKind::Secondary));

	CentralizedClientOptions centralized;
	centralized.port = config_.centralized_broker_port;
	centralized.is_main = is_main;
	centralized.always_interesting = config_.always_interesting;
	std::unique_ptr<EventManager> manager = endpoints_.WrapCentralized(std::move(launch.manager), centralized);

	ClientCallback callback = (is_main && main_callback_.present()) ? main_callback_.Take() : secondary_callback_.Take();
	int code = callback(std::move(launch.state), std::move(manager), core);
	VLOG(1) << (is_main ? "Main" : "Secondary") << " client on core " << core << " finished with " << code;
	return code;
}

} // namespace Flotilla
