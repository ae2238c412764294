#ifndef FLOTILLA_SRC_FLOTILLA_DEMO_FUZZER_H_
#define FLOTILLA_SRC_FLOTILLA_DEMO_FUZZER_H_

#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>

#include "absl/container/flat_hash_set.h"
#include "common/core_affinity.h"
#include "transport/event_manager.h"

namespace Flotilla {

/**
 * Stand-in for a fuzzing loop. Executes random inputs, treats every input
 * landing in an unseen hash bucket as a new testcase, and shares those with
 * the other workers through its endpoint.
 */
class DemoFuzzer {
	public:
		static constexpr size_t kInputSize = 16;
		static constexpr uint32_t kNumBuckets = 1 << 16;
		static constexpr size_t kSyncInterval = 1000;

		DemoFuzzer(std::unique_ptr<EventManager> manager, CoreId core, size_t iterations);

		// Continues from state saved by a previous incarnation; malformed state is ignored.
		void RestoreState(const std::string& state);
		std::string SerializeState() const;

		// Returns the process exit code.
		int Run();

		static uint32_t Bucket(const std::string& input);

		uint64_t executions() const { return executions_; }
		size_t corpus_size() const { return seen_.size(); }

	private:
		void Sync();

		std::unique_ptr<EventManager> manager_;
		const CoreId core_;
		const size_t iterations_;
		std::mt19937_64 rng_;
		uint64_t executions_ = 0;
		uint64_t received_ = 0;
		absl::flat_hash_set<uint32_t> seen_;
};

} // namespace Flotilla

#endif  // FLOTILLA_SRC_FLOTILLA_DEMO_FUZZER_H_
