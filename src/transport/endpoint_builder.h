#ifndef FLOTILLA_SRC_TRANSPORT_ENDPOINT_BUILDER_H_
#define FLOTILLA_SRC_TRANSPORT_ENDPOINT_BUILDER_H_

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "broker.h"
#include "common/config.h"
#include "common/core_affinity.h"
#include "event_config.h"
#include "event_manager.h"
#include "shmem/shmem_provider.h"

namespace Flotilla {

struct ClientOptions {
	uint16_t broker_port = kDefaultBrokerPort;
	CoreId core;
	std::string configuration = "default";
	ShouldSaveState serialize_state = ShouldSaveState::OnRestart;
	std::optional<std::string> time_ref;
	ClientKind kind = ClientKind::Client;
};

struct CentralizedBrokerOptions {
	uint16_t port = kDefaultCentralizedBrokerPort;
	std::chrono::milliseconds client_timeout{kCentralizedClientTimeoutMs};
	std::chrono::milliseconds poll_interval{kCentralizedPollIntervalMs};
};

struct CentralizedClientOptions {
	uint16_t port = kDefaultCentralizedBrokerPort;
	bool is_main = false;
	bool always_interesting = false;
};

// What a worker starts with: the state its previous incarnation saved (none
// on first launch) and its live endpoint.
struct ClientLaunch {
	std::optional<std::string> state;
	std::unique_ptr<EventManager> manager;
};

/**
 * Builds every endpoint a launcher needs. The launchers only talk to this
 * interface, so tests can drive them without sockets.
 */
class EndpointFactory {
	public:
		virtual ~EndpointFactory() = default;

		// Pins the calling process to options.core and attaches it to the broker.
		virtual ClientLaunch LaunchClient(const ClientOptions& options) = 0;

		// Serves the first-tier broker; blocks until its exit condition.
		virtual void RunBroker(const BrokerOptions& options) = 0;

		// Serves the aggregation broker; blocks until every client is gone.
		virtual void RunCentralizedBroker(const CentralizedBrokerOptions& options) = 0;

		// Connects a worker's endpoint to the centralized broker.
		virtual std::unique_ptr<EventManager> WrapCentralized(std::unique_ptr<EventManager> inner,
				const CentralizedClientOptions& options) = 0;
};

class EndpointBuilder : public EndpointFactory {
	public:
		EndpointBuilder(ShMemProvider& provider, size_t state_slot_size = kDefaultStateSlotSize);

		ClientLaunch LaunchClient(const ClientOptions& options) override;
		void RunBroker(const BrokerOptions& options) override;
		void RunCentralizedBroker(const CentralizedBrokerOptions& options) override;
		std::unique_ptr<EventManager> WrapCentralized(std::unique_ptr<EventManager> inner,
				const CentralizedClientOptions& options) override;

	private:
		ShMemProvider& provider_;
		const size_t state_slot_size_;
};

// "127.0.0.1:<port>"
std::string LocalBrokerAddress(uint16_t port);

} // namespace Flotilla

#endif  // FLOTILLA_SRC_TRANSPORT_ENDPOINT_BUILDER_H_
