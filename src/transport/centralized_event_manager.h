#ifndef FLOTILLA_SRC_TRANSPORT_CENTRALIZED_EVENT_MANAGER_H_
#define FLOTILLA_SRC_TRANSPORT_CENTRALIZED_EVENT_MANAGER_H_

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "event_manager.h"

namespace Flotilla {

/**
 * Wraps a worker's first-tier endpoint with a link to the centralized
 * broker. Secondary workers send their testcases to the centralized broker
 * only; the main worker pulls them from there, decides which ones to keep,
 * and re-fires the accepted ones into its own island.
 */
class CentralizedEventManager : public EventManager {
	public:
		// Decides whether a testcase forwarded by a secondary is kept.
		using Evaluator = std::function<bool(const ReceivedEvent&)>;

		CentralizedEventManager(std::unique_ptr<EventManager> inner,
				std::unique_ptr<EventManager> centralized_link, bool is_main,
				bool always_interesting);

		void Fire(EventKind kind, const std::string& payload) override;
		std::vector<ReceivedEvent> Poll(size_t max_events) override;
		void ReportStats(const ClientStats& stats) override;
		void OnRestart(const std::string& state) override;
		void SendExiting(const std::string& state) override;

		uint64_t client_id() const override { return inner_->client_id(); }
		CoreId core() const override { return inner_->core(); }
		const std::string& configuration() const override { return inner_->configuration(); }

		bool is_main() const { return is_main_; }
		EventManager* inner() { return inner_.get(); }

		void set_evaluator(Evaluator evaluator) { evaluator_ = std::move(evaluator); }

		/**
		 * Main only: pulls testcases secondaries sent to the centralized broker,
		 * re-fires the accepted ones into the first tier and returns them.
		 */
		std::vector<ReceivedEvent> ReceiveFromSecondaries(size_t max_events);

		size_t num_accepted() const { return num_accepted_; }
		size_t num_rejected() const { return num_rejected_; }

	private:
		std::unique_ptr<EventManager> inner_;
		std::unique_ptr<EventManager> centralized_link_;
		const bool is_main_;
		const bool always_interesting_;
		Evaluator evaluator_;
		size_t num_accepted_ = 0;
		size_t num_rejected_ = 0;
};

} // namespace Flotilla

#endif  // FLOTILLA_SRC_TRANSPORT_CENTRALIZED_EVENT_MANAGER_H_
