#include "event_manager.h"

#include <unistd.h>

#include <algorithm>

#include <glog/logging.h>

#include "common/errors.h"

namespace Flotilla {

flotilla_rpc::ClientKind ToProto(ClientKind kind) {
	switch (kind) {
		case ClientKind::Client: return flotilla_rpc::CLIENT;
		case ClientKind::Main: return flotilla_rpc::MAIN;
		case ClientKind::Secondary: return flotilla_rpc::SECONDARY;
		case ClientKind::PeerBroker: return flotilla_rpc::PEER_BROKER;
	}
	return flotilla_rpc::CLIENT;
}

flotilla_rpc::EventKind ToProto(EventKind kind) {
	switch (kind) {
		case EventKind::NewTestcase: return flotilla_rpc::NEW_TESTCASE;
		case EventKind::ClientStats: return flotilla_rpc::CLIENT_STATS;
		case EventKind::Log: return flotilla_rpc::LOG;
	}
	return flotilla_rpc::LOG;
}

EventKind FromProto(flotilla_rpc::EventKind kind) {
	switch (kind) {
		case flotilla_rpc::NEW_TESTCASE: return EventKind::NewTestcase;
		case flotilla_rpc::CLIENT_STATS: return EventKind::ClientStats;
		default: return EventKind::Log;
	}
}

GrpcEventManager::GrpcEventManager(Options options, std::unique_ptr<StateStore> state_store)
	: options_(std::move(options)),
	state_store_(std::move(state_store)) {
		stub_ = flotilla_rpc::Broker::NewStub(
				grpc::CreateChannel(options_.address, grpc::InsecureChannelCredentials()));
		Attach();
		heartbeat_thread_ = std::thread([this]() {
				this->HeartbeatLoop();
				});
	}

GrpcEventManager::~GrpcEventManager() {
	{
		absl::MutexLock lock(&mu_);
		stop_ = true;
	}
	if (heartbeat_thread_.joinable()) {
		heartbeat_thread_.join();
	}
	Detach();
	VLOG(3) << "[GrpcEventManager]: \t\tDestructed";
}

void GrpcEventManager::Attach() {
	flotilla_rpc::AttachRequest request;
	request.set_core(options_.core.id);
	request.set_pid(getpid());
	request.set_kind(ToProto(options_.kind));
	request.set_configuration(options_.configuration);

	auto deadline = std::chrono::system_clock::now() + options_.attach_timeout;
	grpc::Status status;
	flotilla_rpc::AttachReply reply;
	// The broker may not be listening yet; wait_for_ready keeps the call
	// queued until the channel connects or the deadline passes.
	do {
		grpc::ClientContext context;
		context.set_wait_for_ready(true);
		context.set_deadline(std::min(deadline, std::chrono::system_clock::now() + std::chrono::seconds(1)));
		status = stub_->Attach(&context, request, &reply);
		if (status.ok()) {
			break;
		}
		VLOG(2) << "Attach to " << options_.address << " not yet possible: " << status.error_message();
	} while (std::chrono::system_clock::now() < deadline);

	if (!status.ok()) {
		LOG(ERROR) << "Could not attach to broker at " << options_.address << ": " << status.error_message();
		throw ResourceError("Attaching to broker at " + options_.address + ": " + status.error_message());
	}
	if (!reply.success()) {
		throw ResourceError("Broker at " + options_.address + " refused attach: " + reply.message());
	}

	client_id_ = reply.client_id();
	{
		absl::MutexLock lock(&mu_);
		next_sequence_ = reply.next_sequence();
	}
	LOG(INFO) << "Attached to broker " << options_.address << " as " << options_.kind
		<< " #" << client_id_ << " on core " << options_.core;
}

void GrpcEventManager::Detach() {
	if (!broker_alive_.load()) {
		return;
	}
	flotilla_rpc::DetachRequest request;
	request.set_client_id(client_id_);
	flotilla_rpc::DetachReply reply;
	grpc::ClientContext context;
	context.set_deadline(std::chrono::system_clock::now() + std::chrono::seconds(2));
	grpc::Status status = stub_->Detach(&context, request, &reply);
	if (!status.ok()) {
		LOG(WARNING) << "Detach #" << client_id_ << " from " << options_.address
			<< " failed: " << status.error_message();
		return;
	}
	VLOG(1) << "Detached #" << client_id_ << " from " << options_.address;
}

void GrpcEventManager::HeartbeatLoop() {
	while (true) {
		flotilla_rpc::HeartbeatRequest request;
		{
			absl::MutexLock lock(&mu_);
			if (mu_.AwaitWithTimeout(absl::Condition(&stop_),
						absl::Milliseconds(options_.heartbeat_period.count()))) {
				return;
			}
			request.set_executions(stats_.executions);
			request.set_corpus_size(stats_.corpus_size);
			request.set_objective_size(stats_.objective_size);
		}
		request.set_client_id(client_id_);

		flotilla_rpc::HeartbeatReply reply;
		grpc::ClientContext context;
		context.set_deadline(std::chrono::system_clock::now() + options_.heartbeat_period);
		grpc::Status status = stub_->Heartbeat(&context, request, &reply);
		if (!status.ok() || !reply.alive()) {
			if (broker_alive_.exchange(false)) {
				LOG(WARNING) << "Broker at " << options_.address << " stopped answering heartbeats";
			}
		} else {
			broker_alive_.store(true);
		}
	}
}

void GrpcEventManager::Fire(EventKind kind, const std::string& payload) {
	flotilla_rpc::Event event;
	event.set_client_id(client_id_);
	event.set_kind(ToProto(kind));
	event.set_configuration(options_.configuration);
	event.set_payload(payload);
	{
		absl::MutexLock lock(&mu_);
		event.set_executions(stats_.executions);
	}
	Forward(event);
}

void GrpcEventManager::Forward(const flotilla_rpc::Event& event) {
	flotilla_rpc::FireReply reply;
	grpc::ClientContext context;
	context.set_deadline(std::chrono::system_clock::now() + std::chrono::seconds(5));
	grpc::Status status = stub_->Fire(&context, event, &reply);
	if (!status.ok()) {
		LOG(ERROR) << "Fire to " << options_.address << " failed: " << status.error_message();
		throw ResourceError("Firing event to " + options_.address + ": " + status.error_message());
	}
	VLOG(3) << "Fired event #" << reply.sequence() << " (" << event.payload().size() << " bytes)";
}

std::vector<ReceivedEvent> GrpcEventManager::Poll(size_t max_events) {
	flotilla_rpc::PollRequest request;
	request.set_client_id(client_id_);
	request.set_max_events(static_cast<uint32_t>(max_events));
	{
		absl::MutexLock lock(&mu_);
		request.set_after_sequence(next_sequence_ == 0 ? 0 : next_sequence_ - 1);
	}

	flotilla_rpc::PollReply reply;
	grpc::ClientContext context;
	context.set_deadline(std::chrono::system_clock::now() + std::chrono::seconds(5));
	grpc::Status status = stub_->Poll(&context, request, &reply);
	if (!status.ok()) {
		LOG(ERROR) << "Poll from " << options_.address << " failed: " << status.error_message();
		throw ResourceError("Polling " + options_.address + ": " + status.error_message());
	}

	std::vector<ReceivedEvent> events;
	events.reserve(reply.events_size());
	for (const auto& e : reply.events()) {
		ReceivedEvent received;
		received.sequence = e.sequence();
		received.client_id = e.client_id();
		received.kind = FromProto(e.kind());
		received.payload = e.payload();
		received.executions = e.executions();
		events.push_back(std::move(received));
	}
	{
		absl::MutexLock lock(&mu_);
		next_sequence_ = std::max(next_sequence_, reply.next_sequence());
	}
	return events;
}

void GrpcEventManager::ReportStats(const ClientStats& stats) {
	absl::MutexLock lock(&mu_);
	stats_ = stats;
}

void GrpcEventManager::OnRestart(const std::string& state) {
	if (!state_store_ || !SavesOnRestart(options_.serialize_state)) {
		return;
	}
	state_store_->Save(state);
	LOG(INFO) << "Saved " << state.size() << " bytes of state for restart of core " << options_.core;
}

void GrpcEventManager::SendExiting(const std::string& state) {
	if (exiting_sent_.exchange(true)) {
		return;
	}
	if (!state_store_) {
		return;
	}
	if (SavesOnExit(options_.serialize_state)) {
		state_store_->Save(state);
		LOG(INFO) << "Saved " << state.size() << " bytes of state on exit of core " << options_.core;
	} else {
		state_store_->Clear();
	}
}

} // namespace Flotilla
