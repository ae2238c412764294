#include "broker.h"

#include <glog/logging.h>

#include "common/errors.h"
#include "event_manager.h"

namespace Flotilla {

BrokerServiceImpl::BrokerServiceImpl(std::shared_ptr<Monitor> monitor,
		std::chrono::milliseconds client_timeout, size_t log_capacity)
	: monitor_(std::move(monitor)),
	log_capacity_(log_capacity),
	client_timeout_(client_timeout) {}

Status BrokerServiceImpl::Attach(ServerContext* context, const flotilla_rpc::AttachRequest* request,
		flotilla_rpc::AttachReply* reply) {
	absl::MutexLock lock(&mu_);
	if (stopped_) {
		reply->set_success(false);
		reply->set_message("Broker is shutting down");
		return Status::OK;
	}
	uint64_t id = next_client_id_++;
	AttachedClient client;
	client.id = id;
	client.core = request->core();
	client.pid = request->pid();
	client.kind = request->kind() == flotilla_rpc::MAIN ? ClientKind::Main
		: request->kind() == flotilla_rpc::SECONDARY ? ClientKind::Secondary
		: request->kind() == flotilla_rpc::PEER_BROKER ? ClientKind::PeerBroker
		: ClientKind::Client;
	client.configuration = request->configuration();
	client.last_heartbeat = std::chrono::steady_clock::now();
	clients_[id] = client;
	if (client.kind != ClientKind::PeerBroker) {
		ever_attached_++;
	}

	reply->set_success(true);
	reply->set_client_id(id);
	reply->set_next_sequence(next_sequence_);
	reply->set_message("Client attached");
	LOG(INFO) << "Client #" << id << " (" << client.kind << ", pid " << client.pid
		<< ", core " << client.core << ") attached";
	return Status::OK;
}

void BrokerServiceImpl::DisconnectLocked(uint64_t client_id, const char* reason) {
	auto it = clients_.find(client_id);
	if (it == clients_.end()) {
		return;
	}
	// A bridged broker leaving does not count towards the exit quota.
	if (it->second.kind != ClientKind::PeerBroker) {
		disconnected_++;
	}
	LOG(INFO) << "Client #" << client_id << " " << reason << " (" << disconnected_ << " disconnected)";
	clients_.erase(it);
	if (monitor_) {
		monitor_->ClientLeft(client_id);
	}
}

Status BrokerServiceImpl::Detach(ServerContext* context, const flotilla_rpc::DetachRequest* request,
		flotilla_rpc::DetachReply* reply) {
	absl::MutexLock lock(&mu_);
	bool known = clients_.contains(request->client_id());
	DisconnectLocked(request->client_id(), "detached");
	reply->set_success(known);
	return Status::OK;
}

Status BrokerServiceImpl::Heartbeat(ServerContext* context, const flotilla_rpc::HeartbeatRequest* request,
		flotilla_rpc::HeartbeatReply* reply) {
	ClientStats stats;
	{
		absl::MutexLock lock(&mu_);
		auto it = clients_.find(request->client_id());
		if (it == clients_.end()) {
			reply->set_alive(false);
			return Status::OK;
		}
		it->second.last_heartbeat = std::chrono::steady_clock::now();
		it->second.stats.executions = request->executions();
		it->second.stats.corpus_size = request->corpus_size();
		it->second.stats.objective_size = request->objective_size();
		stats = it->second.stats;
		reply->set_alive(true);
	}
	if (monitor_) {
		monitor_->UpdateClient(request->client_id(), stats);
		monitor_->Display("heartbeat", request->client_id());
	}
	return Status::OK;
}

uint64_t BrokerServiceImpl::Publish(flotilla_rpc::Event event) {
	absl::MutexLock lock(&mu_);
	uint64_t sequence = next_sequence_++;
	event.set_sequence(sequence);
	log_.push_back(std::move(event));
	while (log_.size() > log_capacity_) {
		log_.pop_front();
	}
	return sequence;
}

Status BrokerServiceImpl::Fire(ServerContext* context, const flotilla_rpc::Event* request,
		flotilla_rpc::FireReply* reply) {
	std::function<void(const flotilla_rpc::Event&)> forwarder;
	{
		absl::MutexLock lock(&mu_);
		auto it = clients_.find(request->client_id());
		if (it != clients_.end()) {
			it->second.last_heartbeat = std::chrono::steady_clock::now();
		}
		forwarder = forwarder_;
	}

	reply->set_sequence(Publish(*request));
	VLOG(2) << "Event #" << reply->sequence() << " from client #" << request->client_id()
		<< " (" << request->payload().size() << " bytes)";

	if (request->kind() == flotilla_rpc::NEW_TESTCASE) {
		if (monitor_) {
			monitor_->Display("testcase", request->client_id());
		}
		if (forwarder && !request->forwarded()) {
			forwarder(*request);
		}
	}
	return Status::OK;
}

Status BrokerServiceImpl::Poll(ServerContext* context, const flotilla_rpc::PollRequest* request,
		flotilla_rpc::PollReply* reply) {
	absl::MutexLock lock(&mu_);
	auto client = clients_.find(request->client_id());
	bool is_peer = client != clients_.end() && client->second.kind == ClientKind::PeerBroker;
	const std::string* configuration = client != clients_.end() ? &client->second.configuration : nullptr;

	uint32_t max_events = request->max_events() == 0 ? UINT32_MAX : request->max_events();
	uint64_t last = request->after_sequence();
	for (const auto& event : log_) {
		if (event.sequence() <= request->after_sequence()) {
			continue;
		}
		if (static_cast<uint32_t>(reply->events_size()) >= max_events) {
			break;
		}
		last = event.sequence();
		if (event.client_id() == request->client_id()) {
			continue;
		}
		// Peers bridge everything; clients only see their own configuration.
		if (!is_peer && configuration && event.configuration() != *configuration) {
			continue;
		}
		// Do not bounce bridged events back to the bridge.
		if (is_peer && event.forwarded()) {
			continue;
		}
		*reply->add_events() = event;
	}
	reply->set_next_sequence(last + 1);
	return Status::OK;
}

void BrokerServiceImpl::SetForwarder(std::function<void(const flotilla_rpc::Event&)> forwarder) {
	absl::MutexLock lock(&mu_);
	forwarder_ = std::move(forwarder);
}

void BrokerServiceImpl::set_client_timeout(std::chrono::milliseconds timeout) {
	absl::MutexLock lock(&mu_);
	client_timeout_ = timeout;
}

void BrokerServiceImpl::ExpireSilentClientsLocked() {
	auto now = std::chrono::steady_clock::now();
	std::vector<uint64_t> silent;
	for (const auto& entry : clients_) {
		if (now - entry.second.last_heartbeat > client_timeout_) {
			silent.push_back(entry.first);
		}
	}
	for (uint64_t id : silent) {
		LOG(WARNING) << "Client #" << id << " missed heartbeats for " << client_timeout_.count() << "ms";
		DisconnectLocked(id, "timed out");
	}
}

void BrokerServiceImpl::WaitForDisconnects(size_t quota, std::chrono::milliseconds poll_interval) {
	absl::MutexLock lock(&mu_);
	auto done = [this, quota]() {
		return stopped_ || disconnected_ >= quota;
	};
	while (!done()) {
		mu_.AwaitWithTimeout(absl::Condition(&stopped_), absl::Milliseconds(poll_interval.count()));
		ExpireSilentClientsLocked();
	}
	LOG(INFO) << disconnected_ << " of " << quota << " clients disconnected";
}

void BrokerServiceImpl::WaitUntilAllGone(std::chrono::milliseconds poll_interval,
		std::chrono::milliseconds idle_timeout) {
	auto start = std::chrono::steady_clock::now();
	absl::MutexLock lock(&mu_);
	while (!stopped_) {
		mu_.AwaitWithTimeout(absl::Condition(&stopped_), absl::Milliseconds(poll_interval.count()));
		ExpireSilentClientsLocked();
		size_t remaining = 0;
		for (const auto& entry : clients_) {
			if (entry.second.kind != ClientKind::PeerBroker) remaining++;
		}
		if (ever_attached_ > 0 && remaining == 0) {
			LOG(INFO) << "The last client quit";
			return;
		}
		if (ever_attached_ == 0 && std::chrono::steady_clock::now() - start > idle_timeout) {
			LOG(WARNING) << "No client attached within " << idle_timeout.count() << "ms";
			return;
		}
	}
}

void BrokerServiceImpl::Stop() {
	absl::MutexLock lock(&mu_);
	stopped_ = true;
}

size_t BrokerServiceImpl::num_attached() const {
	absl::MutexLock lock(&mu_);
	return clients_.size();
}

size_t BrokerServiceImpl::num_disconnected() const {
	absl::MutexLock lock(&mu_);
	return disconnected_;
}

size_t BrokerServiceImpl::num_ever_attached() const {
	absl::MutexLock lock(&mu_);
	return ever_attached_;
}

Broker::Broker(BrokerOptions options)
	: options_(std::move(options)),
	service_(std::make_unique<BrokerServiceImpl>(options_.monitor, options_.client_timeout)) {}

Broker::~Broker() {
	Shutdown();
}

void Broker::Start() {
	if (server_) {
		return;
	}
	std::string host = options_.bind_public ? "0.0.0.0" : "127.0.0.1";
	std::string address = host + ":" + std::to_string(options_.port);

	ServerBuilder builder;
	builder.AddListeningPort(address, grpc::InsecureServerCredentials(), &bound_port_);
	builder.RegisterService(service_.get());
	server_ = builder.BuildAndStart();
	if (!server_ || bound_port_ == 0) {
		server_.reset();
		LOG(ERROR) << "Broker failed to bind " << address;
		throw ResourceError("Binding broker to " + address);
	}
	LOG(INFO) << "Broker listening on " << host << ":" << bound_port_;

	if (options_.remote_broker_addr) {
		ConnectBridge();
	}
}

void Broker::ConnectBridge() {
	GrpcEventManager::Options bridge_options;
	bridge_options.address = *options_.remote_broker_addr;
	bridge_options.kind = ClientKind::PeerBroker;
	bridge_options.configuration = options_.configuration;
	bridge_options.serialize_state = ShouldSaveState::Never;
	bridge_ = std::make_unique<GrpcEventManager>(bridge_options, nullptr);

	service_->SetForwarder([this](const flotilla_rpc::Event& event) {
			flotilla_rpc::Event forwarded = event;
			forwarded.set_forwarded(true);
			forwarded.set_client_id(bridge_->client_id());
			try {
				bridge_->Forward(forwarded);
			} catch (const ResourceError& e) {
				LOG(WARNING) << "Dropping bridged testcase: " << e.what();
			}
	});
	bridge_thread_ = std::thread([this]() {
			this->BridgeLoop();
			});
	LOG(INFO) << "Bridged to remote broker " << *options_.remote_broker_addr;
}

void Broker::BridgeLoop() {
	while (!bridge_stop_.load()) {
		std::this_thread::sleep_for(options_.poll_interval);
		std::vector<ReceivedEvent> events;
		try {
			events = bridge_->Poll(0);
		} catch (const ResourceError& e) {
			LOG(WARNING) << "Polling remote broker failed: " << e.what();
			continue;
		}
		for (auto& received : events) {
			flotilla_rpc::Event event;
			// Remote client ids mean nothing here; 0 is never assigned locally.
			event.set_client_id(0);
			event.set_kind(ToProto(received.kind));
			event.set_configuration(options_.configuration);
			event.set_payload(std::move(received.payload));
			event.set_executions(received.executions);
			event.set_forwarded(true);
			service_->Publish(std::move(event));
		}
	}
}

void Broker::Run() {
	Start();
	if (options_.exit_cleanly_after) {
		LOG(INFO) << "Broker exits cleanly after " << *options_.exit_cleanly_after << " clients disconnected";
		service_->WaitForDisconnects(*options_.exit_cleanly_after, options_.poll_interval);
	} else {
		service_->WaitForDisconnects(SIZE_MAX, options_.poll_interval);
	}
	Shutdown();
}

void Broker::LoopWithTimeouts(std::chrono::milliseconds client_timeout,
		std::chrono::milliseconds poll_interval) {
	Start();
	service_->set_client_timeout(client_timeout);
	service_->WaitUntilAllGone(poll_interval, client_timeout);
	Shutdown();
}

void Broker::Shutdown() {
	service_->Stop();
	absl::MutexLock lock(&shutdown_mu_);
	// Fire handlers may still be forwarding through the bridge; drain them first.
	service_->SetForwarder(nullptr);
	if (server_) {
		server_->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(1));
		server_->Wait();
		server_.reset();
		VLOG(1) << "Broker on port " << bound_port_ << " shut down";
	}
	bridge_stop_.store(true);
	if (bridge_thread_.joinable()) {
		bridge_thread_.join();
	}
	bridge_.reset();
}

} // namespace Flotilla
