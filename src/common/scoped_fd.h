#ifndef FLOTILLA_SRC_COMMON_SCOPED_FD_H_
#define FLOTILLA_SRC_COMMON_SCOPED_FD_H_

#include <unistd.h>

#include <utility>

namespace Flotilla {

/**
 * Sole owner of a file descriptor: redirection targets held by the
 * launcher for its whole life, and shm descriptors that only live until
 * the segment is mapped. A negative descriptor means "none".
 */
class ScopedFd {
	public:
		ScopedFd() = default;
		explicit ScopedFd(int fd) : fd_(fd) {}
		~ScopedFd() { Reset(); }

		ScopedFd(const ScopedFd&) = delete;
		ScopedFd& operator=(const ScopedFd&) = delete;

		ScopedFd(ScopedFd&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
		ScopedFd& operator=(ScopedFd&& other) noexcept {
			if (this != &other) {
				Reset(std::exchange(other.fd_, -1));
			}
			return *this;
		}

		// Closes the owned descriptor (if any) and takes fd instead.
		void Reset(int fd = -1) {
			if (fd_ >= 0) {
				::close(fd_);
			}
			fd_ = fd;
		}

		int get() const { return fd_; }
		bool valid() const { return fd_ >= 0; }

	private:
		int fd_ = -1;
};

} // namespace Flotilla

#endif  // FLOTILLA_SRC_COMMON_SCOPED_FD_H_
