#ifndef FLOTILLA_SRC_COMMON_ERRORS_H_
#define FLOTILLA_SRC_COMMON_ERRORS_H_

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>

namespace Flotilla {

// Base of every error the launcher raises on purpose.
class LaunchError : public std::runtime_error {
	public:
		explicit LaunchError(const std::string& what) : std::runtime_error(what) {}
};

// Bad input detected before any process exists (empty core set, missing
// callback, malformed environment marker, invalid config values).
class ConfigError : public LaunchError {
	public:
		explicit ConfigError(const std::string& what) : LaunchError(what) {}
};

// An OS or transport resource could not be acquired.
class ResourceError : public LaunchError {
	public:
		explicit ResourceError(const std::string& what, int err = 0)
			: LaunchError(err ? what + ": " + std::strerror(err) : what), errno_(err) {}

		// Captures the current errno.
		static ResourceError FromErrno(const std::string& what) {
			return ResourceError(what, errno);
		}

		int error_code() const { return errno_; }

	private:
		int errno_;
};

} // namespace Flotilla

#endif  // FLOTILLA_SRC_COMMON_ERRORS_H_
