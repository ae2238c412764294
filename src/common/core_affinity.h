#ifndef FLOTILLA_SRC_COMMON_CORE_AFFINITY_H_
#define FLOTILLA_SRC_COMMON_CORE_AFFINITY_H_

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace Flotilla {

struct CoreId {
	size_t id = 0;

	CoreId() = default;
	explicit CoreId(size_t i) : id(i) {}

	// Pins the calling process to this core. Throws ResourceError.
	void SetAffinity() const;

	bool operator==(const CoreId& o) const { return id == o.id; }
	bool operator!=(const CoreId& o) const { return id != o.id; }
	bool operator<(const CoreId& o) const { return id < o.id; }
};

std::ostream& operator<<(std::ostream& os, const CoreId& core);

// Cores this process may run on, from sched_getaffinity. Throws ResourceError.
std::vector<CoreId> GetCoreIds();

/**
 * Ordered set of distinct cores a launch binds workers to.
 */
class Cores {
	public:
		Cores() = default;
		// Sorts and deduplicates.
		explicit Cores(std::vector<CoreId> ids);

		/**
		 * Parses "all", or a comma separated list of ids and inclusive ranges
		 * such as "0,2-4". Throws ConfigError on malformed input.
		 */
		static Cores FromCmdline(const std::string& args);

		static Cores All();

		const std::vector<CoreId>& ids() const { return ids_; }
		size_t size() const { return ids_.size(); }
		bool empty() const { return ids_.empty(); }
		bool Contains(CoreId core) const;
		// Zero-based position of core in the set, if present.
		std::optional<size_t> Position(CoreId core) const;

		std::string ToString() const;

	private:
		std::vector<CoreId> ids_;
};

std::ostream& operator<<(std::ostream& os, const Cores& cores);

} // namespace Flotilla

#endif  // FLOTILLA_SRC_COMMON_CORE_AFFINITY_H_
