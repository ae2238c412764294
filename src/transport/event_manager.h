#ifndef FLOTILLA_SRC_TRANSPORT_EVENT_MANAGER_H_
#define FLOTILLA_SRC_TRANSPORT_EVENT_MANAGER_H_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <broker.grpc.pb.h>

#include "absl/synchronization/mutex.h"
#include "common/core_affinity.h"
#include "event_config.h"
#include "state_store.h"

namespace Flotilla {

struct ReceivedEvent {
	uint64_t sequence = 0;
	uint64_t client_id = 0;
	EventKind kind = EventKind::NewTestcase;
	std::string payload;
	uint64_t executions = 0;
};

/**
 * A worker's live connection to its broker. Handed to the client callback,
 * which owns it for the rest of the worker's life.
 */
class EventManager {
	public:
		virtual ~EventManager() = default;

		virtual void Fire(EventKind kind, const std::string& payload) = 0;
		// Events other clients fired since the last call.
		virtual std::vector<ReceivedEvent> Poll(size_t max_events) = 0;
		// Stats are shipped with the next heartbeat.
		virtual void ReportStats(const ClientStats& stats) = 0;

		// The worker is about to be restarted; persists state per the policy.
		virtual void OnRestart(const std::string& state) = 0;
		// The worker is exiting cleanly; persists or discards state per the policy.
		virtual void SendExiting(const std::string& state) = 0;

		virtual uint64_t client_id() const = 0;
		virtual CoreId core() const = 0;
		virtual const std::string& configuration() const = 0;
};

/**
 * EventManager talking to a broker over gRPC. Keeps retrying to attach until
 * the broker is up (workers may start before the broker binds), heartbeats
 * from a background thread, and detaches on destruction.
 */
class GrpcEventManager : public EventManager {
	public:
		struct Options {
			std::string address;
			CoreId core;
			ClientKind kind = ClientKind::Client;
			std::string configuration = "default";
			ShouldSaveState serialize_state = ShouldSaveState::OnRestart;
			std::optional<std::string> time_ref;
			std::chrono::milliseconds attach_timeout{30000};
			std::chrono::milliseconds heartbeat_period{1000};
		};

		// state_store may be null when the endpoint never persists state.
		GrpcEventManager(Options options, std::unique_ptr<StateStore> state_store);
		~GrpcEventManager() override;

		GrpcEventManager(const GrpcEventManager&) = delete;
		GrpcEventManager& operator=(const GrpcEventManager&) = delete;

		void Fire(EventKind kind, const std::string& payload) override;
		std::vector<ReceivedEvent> Poll(size_t max_events) override;
		void ReportStats(const ClientStats& stats) override;
		void OnRestart(const std::string& state) override;
		void SendExiting(const std::string& state) override;

		uint64_t client_id() const override { return client_id_; }
		CoreId core() const override { return options_.core; }
		const std::string& configuration() const override { return options_.configuration; }
		ClientKind kind() const { return options_.kind; }
		const std::optional<std::string>& time_ref() const { return options_.time_ref; }
		bool broker_alive() const { return broker_alive_.load(); }

		// Forwards a raw event (used by broker bridges); keeps its payload and origin flags.
		void Forward(const flotilla_rpc::Event& event);

	private:
		void Attach();
		void Detach();
		void HeartbeatLoop();

		const Options options_;
		std::unique_ptr<StateStore> state_store_;
		std::unique_ptr<flotilla_rpc::Broker::Stub> stub_;
		uint64_t client_id_ = 0;

		absl::Mutex mu_;
		uint64_t next_sequence_ ABSL_GUARDED_BY(mu_) = 0;
		ClientStats stats_ ABSL_GUARDED_BY(mu_);
		bool stop_ ABSL_GUARDED_BY(mu_) = false;

		std::atomic<bool> broker_alive_{true};
		std::atomic<bool> exiting_sent_{false};
		std::thread heartbeat_thread_;
};

flotilla_rpc::ClientKind ToProto(ClientKind kind);
flotilla_rpc::EventKind ToProto(EventKind kind);
EventKind FromProto(flotilla_rpc::EventKind kind);

} // namespace Flotilla

#endif  // FLOTILLA_SRC_TRANSPORT_EVENT_MANAGER_H_
