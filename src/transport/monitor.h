#ifndef FLOTILLA_SRC_TRANSPORT_MONITOR_H_
#define FLOTILLA_SRC_TRANSPORT_MONITOR_H_

#include <chrono>
#include <cstdint>
#include <string>

#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"

#include "event_config.h"

namespace Flotilla {

// Receives client statistics gathered by a broker.
class Monitor {
	public:
		virtual ~Monitor() = default;
		virtual void UpdateClient(uint64_t client_id, const ClientStats& stats) = 0;
		virtual void ClientLeft(uint64_t client_id) = 0;
		// event names what triggered the update, e.g. "testcase" or "heartbeat".
		virtual void Display(const std::string& event, uint64_t client_id) = 0;
};

// Prints aggregated stats with glog, at most once per interval.
class LogMonitor : public Monitor {
	public:
		explicit LogMonitor(std::chrono::milliseconds interval = std::chrono::seconds(5));

		void UpdateClient(uint64_t client_id, const ClientStats& stats) override;
		void ClientLeft(uint64_t client_id) override;
		void Display(const std::string& event, uint64_t client_id) override;

		ClientStats Totals() const;
		size_t num_clients() const;

	private:
		const std::chrono::milliseconds interval_;
		const std::chrono::steady_clock::time_point start_;

		mutable absl::Mutex mu_;
		absl::flat_hash_map<uint64_t, ClientStats> clients_ ABSL_GUARDED_BY(mu_);
		std::chrono::steady_clock::time_point last_print_ ABSL_GUARDED_BY(mu_);
};

} // namespace Flotilla

#endif  // FLOTILLA_SRC_TRANSPORT_MONITOR_H_
