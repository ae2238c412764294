#include "demo_fuzzer.h"

#include <unistd.h>

#include <functional>
#include <sstream>

#include <glog/logging.h>

#include "common/errors.h"

namespace Flotilla {

DemoFuzzer::DemoFuzzer(std::unique_ptr<EventManager> manager, CoreId core, size_t iterations)
	: manager_(std::move(manager)),
	core_(core),
	iterations_(iterations),
	rng_(static_cast<uint64_t>(getpid()) * 7919 + core.id) {}

uint32_t DemoFuzzer::Bucket(const std::string& input) {
	return static_cast<uint32_t>(std::hash<std::string>{}(input) % kNumBuckets);
}

void DemoFuzzer::RestoreState(const std::string& state) {
	std::istringstream in(state);
	uint64_t executions = 0;
	if (!(in >> executions)) {
		LOG(WARNING) << "Ignoring malformed state on core " << core_;
		return;
	}
	uint32_t bucket;
	while (in >> bucket) {
		if (bucket < kNumBuckets) {
			seen_.insert(bucket);
		}
	}
	executions_ = executions;
	LOG(INFO) << "Core " << core_ << " resumes at " << executions_ << " executions with "
		<< seen_.size() << " known buckets";
}

std::string DemoFuzzer::SerializeState() const {
	std::ostringstream out;
	out << executions_;
	for (uint32_t bucket : seen_) {
		out << ' ' << bucket;
	}
	return out.str();
}

void DemoFuzzer::Sync() {
	ClientStats stats;
	stats.executions = executions_;
	stats.corpus_size = seen_.size();
	manager_->ReportStats(stats);

	for (const auto& event : manager_->Poll(64)) {
		if (event.kind != EventKind::NewTestcase) {
			continue;
		}
		received_++;
		seen_.insert(Bucket(event.payload));
	}
}

int DemoFuzzer::Run() {
	std::uniform_int_distribution<int> byte(0, 255);
	std::string input(kInputSize, '\0');
	size_t done = 0;
	try {
		while (done < iterations_) {
			for (auto& c : input) {
				c = static_cast<char>(byte(rng_));
			}
			executions_++;
			done++;
			if (seen_.insert(Bucket(input)).second) {
				manager_->Fire(EventKind::NewTestcase, input);
			}
			if (done % kSyncInterval == 0) {
				Sync();
			}
		}
		Sync();
		manager_->SendExiting(SerializeState());
	} catch (const LaunchError& e) {
		LOG(ERROR) << "Worker on core " << core_ << " lost its broker: " << e.what();
		return 1;
	}
	LOG(INFO) << "Worker on core " << core_ << " done: " << executions_ << " executions, "
		<< seen_.size() << " buckets, " << received_ << " testcases from peers";
	return 0;
}

} // namespace Flotilla
