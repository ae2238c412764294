#ifndef FLOTILLA_SRC_TRANSPORT_STATE_STORE_H_
#define FLOTILLA_SRC_TRANSPORT_STATE_STORE_H_

#include <memory>
#include <optional>
#include <string>

#include "common/core_affinity.h"
#include "shmem/shmem_provider.h"

namespace Flotilla {

/**
 * Per-(configuration, core) shared-memory slot through which a worker hands
 * its application state to its next incarnation. The slot is a named
 * segment, so it survives the worker process.
 */
class StateStore {
	public:
		StateStore(ShMemProvider& provider, const std::string& configuration, CoreId core,
				size_t slot_size);

		// The saved state, or nullopt when nothing was saved (first launch).
		std::optional<std::string> Load();

		// Throws ResourceError if the state does not fit the slot.
		void Save(const std::string& state);

		// Forgets any saved state and removes the slot.
		void Clear();

		const std::string& slot_name() const { return slot_name_; }
		size_t capacity() const;

	private:
		struct SlotHeader {
			uint64_t magic;
			uint64_t length;
		};
		static constexpr uint64_t kMagic = 0x464c4f5453544154ULL;  // "FLOTSTAT"

		std::shared_ptr<ShMem> Attach(bool create);

		ShMemProvider& provider_;
		const std::string slot_name_;
		const size_t slot_size_;
		std::shared_ptr<ShMem> slot_;
};

} // namespace Flotilla

#endif  // FLOTILLA_SRC_TRANSPORT_STATE_STORE_H_
