#ifndef FLOTILLA_SRC_SHMEM_SHMEM_PROVIDER_H_
#define FLOTILLA_SRC_SHMEM_SHMEM_PROVIDER_H_

#include <sys/types.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"

namespace Flotilla {

/**
 * A mapped shared-memory segment. Unmapped on destruction; the backing
 * object of an owned segment is unlinked too, and only the process that
 * created it owns it.
 */
class ShMem {
	public:
		ShMem(std::string name, void* addr, size_t size, bool owner);
		~ShMem();

		ShMem(const ShMem&) = delete;
		ShMem& operator=(const ShMem&) = delete;

		const std::string& name() const { return name_; }
		void* addr() const { return addr_; }
		uint8_t* bytes() const { return static_cast<uint8_t*>(addr_); }
		size_t size() const { return size_; }
		bool owner() const { return owner_; }

	private:
		friend class PosixShMemProvider;

		std::string name_;
		void* addr_;
		size_t size_;
		bool owner_;
};

/**
 * Owns the shared-memory segments of a process. PreFork()/PostFork() must
 * bracket every fork() so the segment table stays valid on both sides.
 */
class ShMemProvider {
	public:
		virtual ~ShMemProvider() = default;

		// Creates a fresh segment owned by this process.
		virtual std::shared_ptr<ShMem> NewShMem(size_t size) = 0;

		// Attaches to a named segment, creating it if create is set. Named
		// segments outlive this process until Unlink().
		virtual std::shared_ptr<ShMem> ShMemByName(const std::string& name, size_t size, bool create) = 0;

		// Removes a named segment from the system.
		virtual void Unlink(const std::string& name) = 0;

		virtual void PreFork() = 0;
		virtual void PostFork(bool is_child) = 0;
};

class PosixShMemProvider : public ShMemProvider {
	public:
		// prefix names every segment this provider creates.
		explicit PosixShMemProvider(std::string prefix = "flotilla");
		~PosixShMemProvider() override;

		std::shared_ptr<ShMem> NewShMem(size_t size) override;
		std::shared_ptr<ShMem> ShMemByName(const std::string& name, size_t size, bool create) override;
		void Unlink(const std::string& name) override;

		void PreFork() override;
		void PostFork(bool is_child) override;

		bool fork_in_progress() const;
		size_t num_segments() const;

	private:
		void CheckNotForking() const ABSL_SHARED_LOCKS_REQUIRED(mu_);
		std::shared_ptr<ShMem> Map(const std::string& name, size_t size, bool create, bool own);

		const std::string prefix_;
		uint64_t next_id_ = 0;

		mutable absl::Mutex mu_;
		bool fork_in_progress_ ABSL_GUARDED_BY(mu_) = false;
		absl::flat_hash_map<std::string, std::weak_ptr<ShMem>> segments_ ABSL_GUARDED_BY(mu_);
};

} // namespace Flotilla

#endif  // FLOTILLA_SRC_SHMEM_SHMEM_PROVIDER_H_
