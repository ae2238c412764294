#include "monitor.h"

#include <glog/logging.h>

namespace Flotilla {

LogMonitor::LogMonitor(std::chrono::milliseconds interval)
	: interval_(interval), start_(std::chrono::steady_clock::now()), last_print_() {}

void LogMonitor::UpdateClient(uint64_t client_id, const ClientStats& stats) {
	absl::MutexLock lock(&mu_);
	clients_[client_id] = stats;
}

void LogMonitor::ClientLeft(uint64_t client_id) {
	absl::MutexLock lock(&mu_);
	clients_.erase(client_id);
}

ClientStats LogMonitor::Totals() const {
	absl::MutexLock lock(&mu_);
	ClientStats total;
	for (const auto& entry : clients_) {
		total.executions += entry.second.executions;
		total.corpus_size += entry.second.corpus_size;
		total.objective_size += entry.second.objective_size;
	}
	return total;
}

size_t LogMonitor::num_clients() const {
	absl::MutexLock lock(&mu_);
	return clients_.size();
}

void LogMonitor::Display(const std::string& event, uint64_t client_id) {
	auto now = std::chrono::steady_clock::now();
	{
		absl::MutexLock lock(&mu_);
		if (now - last_print_ < interval_) {
			return;
		}
		last_print_ = now;
	}

	ClientStats total = Totals();
	auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - start_).count();
	uint64_t execs_per_sec = elapsed > 0 ? total.executions / static_cast<uint64_t>(elapsed) : total.executions;
	LOG(INFO) << "[" << event << " #" << client_id << "] run time: " << elapsed << "s"
		<< ", clients: " << num_clients()
		<< ", corpus: " << total.corpus_size
		<< ", objectives: " << total.objective_size
		<< ", executions: " << total.executions
		<< ", exec/sec: " << execs_per_sec;
}

} // namespace Flotilla
