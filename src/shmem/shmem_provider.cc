#include "shmem_provider.h"

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cstring>
#include <stdexcept>

#include <glog/logging.h>

#include "common/errors.h"
#include "common/scoped_fd.h"

namespace Flotilla {

ShMem::ShMem(std::string name, void* addr, size_t size, bool owner)
	: name_(std::move(name)), addr_(addr), size_(size), owner_(owner) {}

ShMem::~ShMem() {
	if (addr_ != nullptr && munmap(addr_, size_) < 0) {
		LOG(ERROR) << "Unmapping " << name_ << " failed: " << strerror(errno);
	}
	if (owner_ && shm_unlink(name_.c_str()) < 0 && errno != ENOENT) {
		LOG(ERROR) << "Unlinking " << name_ << " failed: " << strerror(errno);
	}
	VLOG(3) << "[ShMem]: released " << name_;
}

PosixShMemProvider::PosixShMemProvider(std::string prefix)
	: prefix_(std::move(prefix)) {}

PosixShMemProvider::~PosixShMemProvider() {
	absl::MutexLock lock(&mu_);
	if (fork_in_progress_) {
		LOG(WARNING) << "ShMemProvider destroyed between PreFork and PostFork";
	}
}

void PosixShMemProvider::CheckNotForking() const {
	if (fork_in_progress_) {
		throw std::logic_error("Shared memory allocation between PreFork and PostFork");
	}
}

std::shared_ptr<ShMem> PosixShMemProvider::NewShMem(size_t size) {
	std::string name;
	{
		absl::MutexLock lock(&mu_);
		CheckNotForking();
		name = "/" + prefix_ + "_" + std::to_string(getpid()) + "_" + std::to_string(next_id_++);
	}
	return Map(name, size, true, true);
}

std::shared_ptr<ShMem> PosixShMemProvider::ShMemByName(const std::string& name, size_t size, bool create) {
	{
		absl::MutexLock lock(&mu_);
		CheckNotForking();
	}
	std::string full = name.empty() || name[0] != '/' ? "/" + name : name;
	return Map(full, size, create, false);
}

std::shared_ptr<ShMem> PosixShMemProvider::Map(const std::string& name, size_t size, bool create, bool own) {
	if (size == 0) {
		throw ResourceError("Refusing to map empty segment " + name);
	}

	bool created = false;
	int fd = -1;
	if (create) {
		// Exclusive first, so we know whether we have to size the object.
		fd = shm_open(name.c_str(), O_CREAT | O_EXCL | O_RDWR, 0600);
		if (fd >= 0) {
			created = true;
		} else if (errno == EEXIST) {
			fd = shm_open(name.c_str(), O_RDWR, 0600);
		}
	} else {
		fd = shm_open(name.c_str(), O_RDWR, 0600);
	}
	ScopedFd shm_fd(fd);
	if (!shm_fd.valid()) {
		int err = errno;
		if (err == ENOENT && !create) {
			VLOG(1) << "No shared memory named " << name;
		} else {
			LOG(ERROR) << "shm_open " << name << " failed: " << strerror(err);
		}
		throw ResourceError("Opening shared memory " + name, err);
	}

	if (created) {
		if (ftruncate(shm_fd.get(), size) == -1) {
			int err = errno;
			shm_unlink(name.c_str());
			LOG(ERROR) << "ftruncate " << name << " failed: " << strerror(err);
			throw ResourceError("Sizing shared memory " + name, err);
		}
	} else {
		struct stat st;
		if (fstat(shm_fd.get(), &st) == -1) {
			throw ResourceError::FromErrno("Inspecting shared memory " + name);
		}
		if (static_cast<size_t>(st.st_size) < size) {
			throw ResourceError("Shared memory " + name + " is smaller than " + std::to_string(size) + " bytes");
		}
	}

	void* addr = mmap(nullptr, size, PROT_READ | PROT_WRITE, MAP_SHARED, shm_fd.get(), 0);
	if (addr == MAP_FAILED) {
		int err = errno;
		if (created) shm_unlink(name.c_str());
		LOG(ERROR) << "Mapping " << name << " failed: " << strerror(err);
		throw ResourceError("Mapping shared memory " + name, err);
	}

	bool owner = created && own;
	auto shmem = std::make_shared<ShMem>(name, addr, size, owner);
	{
		absl::MutexLock lock(&mu_);
		segments_[name] = shmem;
	}
	VLOG(2) << "[ShMemProvider]: mapped " << name << " (" << size << " bytes, owner=" << owner << ")";
	return shmem;
}

void PosixShMemProvider::Unlink(const std::string& name) {
	std::string full = name.empty() || name[0] != '/' ? "/" + name : name;
	if (shm_unlink(full.c_str()) < 0 && errno != ENOENT) {
		throw ResourceError::FromErrno("Unlinking shared memory " + full);
	}
	absl::MutexLock lock(&mu_);
	auto it = segments_.find(full);
	if (it != segments_.end()) {
		if (auto live = it->second.lock()) {
			live->owner_ = false;
		}
		segments_.erase(it);
	}
}

void PosixShMemProvider::PreFork() {
	absl::MutexLock lock(&mu_);
	if (fork_in_progress_) {
		throw std::logic_error("PreFork called twice without PostFork");
	}
	// Drop entries whose segment is already gone.
	for (auto it = segments_.begin(); it != segments_.end();) {
		if (it->second.expired()) {
			segments_.erase(it++);
		} else {
			++it;
		}
	}
	fork_in_progress_ = true;
}

void PosixShMemProvider::PostFork(bool is_child) {
	absl::MutexLock lock(&mu_);
	if (!fork_in_progress_) {
		throw std::logic_error("PostFork called without PreFork");
	}
	fork_in_progress_ = false;
	if (!is_child) {
		return;
	}
	// The child sees the parent's mappings but must not unlink them.
	for (auto& entry : segments_) {
		if (auto live = entry.second.lock()) {
			live->owner_ = false;
		}
	}
	VLOG(2) << "[ShMemProvider]: child " << getpid() << " released ownership of "
		<< segments_.size() << " segments";
}

bool PosixShMemProvider::fork_in_progress() const {
	absl::MutexLock lock(&mu_);
	return fork_in_progress_;
}

size_t PosixShMemProvider::num_segments() const {
	absl::MutexLock lock(&mu_);
	size_t live = 0;
	for (const auto& entry : segments_) {
		if (!entry.second.expired()) ++live;
	}
	return live;
}

} // namespace Flotilla
