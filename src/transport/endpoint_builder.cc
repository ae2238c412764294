#include "endpoint_builder.h"

#include <unistd.h>

#include <glog/logging.h>

#include "centralized_event_manager.h"

namespace Flotilla {

std::string LocalBrokerAddress(uint16_t port) {
	return "127.0.0.1:" + std::to_string(port);
}

EndpointBuilder::EndpointBuilder(ShMemProvider& provider, size_t state_slot_size)
	: provider_(provider), state_slot_size_(state_slot_size) {}

ClientLaunch EndpointBuilder::LaunchClient(const ClientOptions& options) {
	options.core.SetAffinity();
	LOG(INFO) << "Child " << getpid() << " bound to core " << options.core;

	std::unique_ptr<StateStore> store;
	std::optional<std::string> state;
	if (options.serialize_state != ShouldSaveState::Never) {
		store = std::make_unique<StateStore>(provider_, options.configuration, options.core, state_slot_size_);
		state = store->Load();
		if (state) {
			LOG(INFO) << "Restored " << state->size() << " bytes of state on core " << options.core;
		}
	}

	GrpcEventManager::Options manager_options;
	manager_options.address = LocalBrokerAddress(options.broker_port);
	manager_options.core = options.core;
	manager_options.kind = options.kind;
	manager_options.configuration = options.configuration;
	manager_options.serialize_state = options.serialize_state;
	manager_options.time_ref = options.time_ref;
	manager_options.attach_timeout = std::chrono::milliseconds(kAttachTimeoutMs);
	manager_options.heartbeat_period = std::chrono::milliseconds(kHeartbeatPeriodMs);

	ClientLaunch launch;
	launch.state = std::move(state);
	launch.manager = std::make_unique<GrpcEventManager>(std::move(manager_options), std::move(store));
	return launch;
}

void EndpointBuilder::RunBroker(const BrokerOptions& options) {
	Broker broker(options);
	broker.Start();
	LOG(INFO) << "I am broker!! (port " << broker.port() << ")";
	broker.Run();
}

void EndpointBuilder::RunCentralizedBroker(const CentralizedBrokerOptions& options) {
	BrokerOptions broker_options;
	broker_options.port = options.port;
	broker_options.configuration = "centralized";
	broker_options.client_timeout = options.client_timeout;
	broker_options.poll_interval = options.poll_interval;

	Broker broker(broker_options);
	broker.Start();
	LOG(INFO) << "I am centralized broker (port " << broker.port() << ")";
	broker.LoopWithTimeouts(options.client_timeout, options.poll_interval);
}

std::unique_ptr<EventManager> EndpointBuilder::WrapCentralized(std::unique_ptr<EventManager> inner,
		const CentralizedClientOptions& options) {
	GrpcEventManager::Options link_options;
	link_options.address = LocalBrokerAddress(options.port);
	link_options.core = inner->core();
	link_options.kind = options.is_main ? ClientKind::Main : ClientKind::Secondary;
	link_options.configuration = inner->configuration();
	link_options.serialize_state = ShouldSaveState::Never;
	link_options.attach_timeout = std::chrono::milliseconds(kAttachTimeoutMs);
	link_options.heartbeat_period = std::chrono::milliseconds(kHeartbeatPeriodMs);

	auto link = std::make_unique<GrpcEventManager>(std::move(link_options), nullptr);
	return std::make_unique<CentralizedEventManager>(std::move(inner), std::move(link),
			options.is_main, options.always_interesting);
}

} // namespace Flotilla
