#include "centralized_event_manager.h"

#include <glog/logging.h>

namespace Flotilla {

CentralizedEventManager::CentralizedEventManager(std::unique_ptr<EventManager> inner,
		std::unique_ptr<EventManager> centralized_link, bool is_main, bool always_interesting)
	: inner_(std::move(inner)),
	centralized_link_(std::move(centralized_link)),
	is_main_(is_main),
	always_interesting_(always_interesting) {
		VLOG(1) << "Centralized endpoint on core " << inner_->core() << (is_main_ ? " (main)" : " (secondary)");
	}

void CentralizedEventManager::Fire(EventKind kind, const std::string& payload) {
	// Secondaries leave testcase decisions to the main node.
	if (kind == EventKind::NewTestcase && !is_main_) {
		centralized_link_->Fire(kind, payload);
		return;
	}
	inner_->Fire(kind, payload);
}

std::vector<ReceivedEvent> CentralizedEventManager::Poll(size_t max_events) {
	if (is_main_) {
		ReceiveFromSecondaries(max_events);
	}
	return inner_->Poll(max_events);
}

std::vector<ReceivedEvent> CentralizedEventManager::ReceiveFromSecondaries(size_t max_events) {
	std::vector<ReceivedEvent> accepted;
	if (!is_main_) {
		return accepted;
	}
	for (auto& event : centralized_link_->Poll(max_events)) {
		if (event.kind != EventKind::NewTestcase) {
			continue;
		}
		bool keep = always_interesting_ || !evaluator_ || evaluator_(event);
		if (!keep) {
			num_rejected_++;
			continue;
		}
		num_accepted_++;
		inner_->Fire(EventKind::NewTestcase, event.payload);
		accepted.push_back(std::move(event));
	}
	if (!accepted.empty()) {
		VLOG(2) << "Main node accepted " << accepted.size() << " testcases from secondaries";
	}
	return accepted;
}

void CentralizedEventManager::ReportStats(const ClientStats& stats) {
	inner_->ReportStats(stats);
	centralized_link_->ReportStats(stats);
}

void CentralizedEventManager::OnRestart(const std::string& state) {
	inner_->OnRestart(state);
}

void CentralizedEventManager::SendExiting(const std::string& state) {
	inner_->SendExiting(state);
}

} // namespace Flotilla
