#ifndef FLOTILLA_SRC_TRANSPORT_BROKER_H_
#define FLOTILLA_SRC_TRANSPORT_BROKER_H_

#include <sys/types.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include <grpcpp/grpcpp.h>
#include <broker.grpc.pb.h>

#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"
#include "common/config.h"
#include "event_config.h"
#include "monitor.h"

namespace Flotilla {

using grpc::Server;
using grpc::ServerBuilder;
using grpc::ServerContext;
using grpc::Status;

class GrpcEventManager;

struct AttachedClient {
	uint64_t id;
	uint64_t core;
	pid_t pid;
	ClientKind kind;
	std::string configuration;
	ClientStats stats;
	std::chrono::steady_clock::time_point last_heartbeat;
};

/**
 * Broker side of the control plane. Tracks attached clients, relays
 * testcases between them through a bounded event log, and counts
 * disconnects (explicit detaches and clients that went silent).
 */
class BrokerServiceImpl final : public flotilla_rpc::Broker::Service {
	public:
		BrokerServiceImpl(std::shared_ptr<Monitor> monitor, std::chrono::milliseconds client_timeout,
				size_t log_capacity = kBrokerEventLogCapacity);

		Status Attach(ServerContext* context, const flotilla_rpc::AttachRequest* request,
				flotilla_rpc::AttachReply* reply) override;
		Status Detach(ServerContext* context, const flotilla_rpc::DetachRequest* request,
				flotilla_rpc::DetachReply* reply) override;
		Status Heartbeat(ServerContext* context, const flotilla_rpc::HeartbeatRequest* request,
				flotilla_rpc::HeartbeatReply* reply) override;
		Status Fire(ServerContext* context, const flotilla_rpc::Event* request,
				flotilla_rpc::FireReply* reply) override;
		Status Poll(ServerContext* context, const flotilla_rpc::PollRequest* request,
				flotilla_rpc::PollReply* reply) override;

		// Appends an event to the log; returns its sequence.
		uint64_t Publish(flotilla_rpc::Event event);

		// Called for every locally fired testcase that did not cross a bridge.
		void SetForwarder(std::function<void(const flotilla_rpc::Event&)> forwarder);

		void set_client_timeout(std::chrono::milliseconds timeout);

		/**
		 * Blocks until quota clients have disconnected or Stop() was called.
		 * Silent clients are expired every poll_interval.
		 */
		void WaitForDisconnects(size_t quota, std::chrono::milliseconds poll_interval);

		/**
		 * Blocks until every client that attached has disconnected again, or
		 * until idle_timeout passes without any client attaching.
		 */
		void WaitUntilAllGone(std::chrono::milliseconds poll_interval, std::chrono::milliseconds idle_timeout);

		void Stop();

		size_t num_attached() const;
		size_t num_disconnected() const;
		size_t num_ever_attached() const;

	private:
		void ExpireSilentClientsLocked() ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);
		void DisconnectLocked(uint64_t client_id, const char* reason) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);

		std::shared_ptr<Monitor> monitor_;
		const size_t log_capacity_;

		mutable absl::Mutex mu_;
		std::chrono::milliseconds client_timeout_ ABSL_GUARDED_BY(mu_);
		absl::flat_hash_map<uint64_t, AttachedClient> clients_ ABSL_GUARDED_BY(mu_);
		std::deque<flotilla_rpc::Event> log_ ABSL_GUARDED_BY(mu_);
		uint64_t next_sequence_ ABSL_GUARDED_BY(mu_) = 1;
		uint64_t next_client_id_ ABSL_GUARDED_BY(mu_) = 1;
		size_t disconnected_ ABSL_GUARDED_BY(mu_) = 0;
		size_t ever_attached_ ABSL_GUARDED_BY(mu_) = 0;
		bool stopped_ ABSL_GUARDED_BY(mu_) = false;
		std::function<void(const flotilla_rpc::Event&)> forwarder_ ABSL_GUARDED_BY(mu_);
};

struct BrokerOptions {
	uint16_t port = kDefaultBrokerPort;
	std::shared_ptr<Monitor> monitor;
	// host:port of a broker on another machine to bridge testcases with
	std::optional<std::string> remote_broker_addr;
	// Run() returns once this many clients disconnected; runs until Shutdown() if unset
	std::optional<size_t> exit_cleanly_after;
	std::string configuration = "default";
	ShouldSaveState serialize_state = ShouldSaveState::OnRestart;
	bool bind_public = false;
	std::chrono::milliseconds client_timeout{kBrokerClientTimeoutMs};
	std::chrono::milliseconds poll_interval{100};
};

class Broker {
	public:
		explicit Broker(BrokerOptions options);
		~Broker();

		Broker(const Broker&) = delete;
		Broker& operator=(const Broker&) = delete;

		// Binds and starts serving. Throws ResourceError when the port is taken.
		void Start();

		// Serves until exit_cleanly_after clients disconnected, then shuts down.
		void Run();

		/**
		 * Serves until every attached client disconnected. A client silent for
		 * client_timeout counts as disconnected.
		 */
		void LoopWithTimeouts(std::chrono::milliseconds client_timeout, std::chrono::milliseconds poll_interval);

		void Shutdown();

		int port() const { return bound_port_; }
		BrokerServiceImpl* service() { return service_.get(); }

	private:
		void ConnectBridge();
		void BridgeLoop();

		const BrokerOptions options_;
		std::unique_ptr<BrokerServiceImpl> service_;
		std::unique_ptr<Server> server_;
		int bound_port_ = 0;

		absl::Mutex shutdown_mu_;
		std::unique_ptr<GrpcEventManager> bridge_;
		std::thread bridge_thread_;
		std::atomic<bool> bridge_stop_{false};
};

} // namespace Flotilla

#endif  // FLOTILLA_SRC_TRANSPORT_BROKER_H_
