#include "reexec_topology.h"

#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <unistd.h>

#include <cstring>
#include <fstream>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <thread>

#include <glog/logging.h>

#include "common/env_flags.h"
#include "common/errors.h"
#include "fork_topology.h"
#include "launch_config.h"

extern char** environ;

namespace Flotilla {

namespace {

std::vector<std::string> ReadOwnCmdline() {
	std::ifstream in("/proc/self/cmdline", std::ios::binary);
	if (!in) {
		throw ResourceError("Reading /proc/self/cmdline");
	}
	std::string raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
	std::vector<std::string> args;
	size_t start = 0;
	while (start < raw.size()) {
		size_t end = raw.find('\0', start);
		if (end == std::string::npos) {
			end = raw.size();
		}
		args.emplace_back(raw.substr(start, end - start));
		start = end + 1;
	}
	return args;
}

std::vector<char*> ToCStrings(std::vector<std::string>& strings) {
	std::vector<char*> out;
	out.reserve(strings.size() + 1);
	for (auto& s : strings) {
		out.push_back(s.data());
	}
	out.push_back(nullptr);
	return out;
}

// Owns a posix_spawn_file_actions_t for the duration of one spawn.
class SpawnFileActions {
	public:
		SpawnFileActions() {
			int ret = posix_spawn_file_actions_init(&actions_);
			if (ret != 0) {
				throw ResourceError("posix_spawn_file_actions_init", ret);
			}
		}
		~SpawnFileActions() { posix_spawn_file_actions_destroy(&actions_); }

		SpawnFileActions(const SpawnFileActions&) = delete;
		SpawnFileActions& operator=(const SpawnFileActions&) = delete;

		void Dup2(int fd, int target) {
			int ret = posix_spawn_file_actions_adddup2(&actions_, fd, target);
			if (ret != 0) {
				throw ResourceError("posix_spawn_file_actions_adddup2", ret);
			}
		}

		void Open(int target, const char* path) {
			int ret = posix_spawn_file_actions_addopen(&actions_, target, path, O_WRONLY | O_APPEND, 0);
			if (ret != 0) {
				throw ResourceError("posix_spawn_file_actions_addopen", ret);
			}
		}

		posix_spawn_file_actions_t* get() { return &actions_; }

	private:
		posix_spawn_file_actions_t actions_;
};

} // namespace

ReexecTopology::ReexecTopology()
	: program_("/proc/self/exe"), argv_(ReadOwnCmdline()) {}

ReexecTopology::ReexecTopology(std::string program, std::vector<std::string> argv)
	: program_(std::move(program)), argv_(std::move(argv)) {}

CoreId ReexecTopology::ParseMarker(const std::string& value) {
	if (value.empty()) {
		throw ConfigError(std::string(kLauncherClientEnv) + " is set but empty");
	}
	size_t id = 0;
	for (char c : value) {
		if (c < '0' || c > '9') {
			throw ConfigError(std::string(kLauncherClientEnv) + "='" + value + "' is not a core index");
		}
		size_t digit = static_cast<size_t>(c - '0');
		if (id > (std::numeric_limits<size_t>::max() - digit) / 10) {
			throw ConfigError(std::string(kLauncherClientEnv) + "='" + value + "' is out of range");
		}
		id = id * 10 + digit;
	}
	return CoreId(id);
}

std::optional<CoreId> ReexecTopology::InheritedCore() const {
	auto marker = ReadEnvString(kLauncherClientEnv);
	if (!marker) {
		return std::nullopt;
	}
	return ParseMarker(*marker);
}

std::vector<std::string> ReexecTopology::ChildEnvironment(CoreId core) const {
	std::vector<std::string> env;
	const std::string prefix = std::string(kLauncherClientEnv) + "=";
	for (char** e = environ; e && *e; ++e) {
		if (std::strncmp(*e, prefix.c_str(), prefix.size()) != 0) {
			env.emplace_back(*e);
		}
	}
	env.push_back(prefix + std::to_string(core.id));
	return env;
}

SpawnResult ReexecTopology::Spawn(const SpawnRequest& request) {
	auto now = std::chrono::steady_clock::now();
	if (!launch_start_ || request.stagger_index <= 1) {
		launch_start_ = now;
	}
	std::this_thread::sleep_until(*launch_start_ + request.launch_delay * request.stagger_index);

	SpawnFileActions actions;
	if (request.output == nullptr || !request.output->debug_output()) {
		if (request.output && request.output->stdout_fd() >= 0) {
			actions.Dup2(request.output->stdout_fd(), STDOUT_FILENO);
		} else {
			actions.Open(STDOUT_FILENO, "/dev/null");
		}
		if (request.output && request.output->stderr_fd() >= 0) {
			actions.Dup2(request.output->stderr_fd(), STDERR_FILENO);
		} else {
			actions.Open(STDERR_FILENO, "/dev/null");
		}
	}

	std::vector<std::string> args = argv_;
	std::vector<std::string> env = ChildEnvironment(request.core);
	std::vector<char*> c_args = ToCStrings(args);
	std::vector<char*> c_env = ToCStrings(env);

	pid_t pid = -1;
	int ret = posix_spawn(&pid, program_.c_str(), actions.get(), nullptr, c_args.data(), c_env.data());
	if (ret != 0) {
		LOG(ERROR) << "posix_spawn(" << program_ << ") for core " << request.core << " failed: " << std::strerror(ret);
		throw ResourceError("Spawning " + program_, ret);
	}
	VLOG(1) << "Spawned worker " << pid << " for core " << request.core;
	return SpawnedParent{ProcessHandle(pid, request.core)};
}

SpawnResult ReexecTopology::Duplicate() {
	throw std::logic_error("Re-exec topology cannot duplicate the running process");
}

std::vector<ExitStatus> ReexecTopology::AwaitAll(std::vector<ProcessHandle>& handles) {
	return WaitForHandles(handles);
}

void ReexecTopology::SignalShutdown(std::vector<ProcessHandle>& handles) {
	SignalHandles(handles, SIGKILL);
	for (const auto& status : WaitForHandles(handles)) {
		VLOG(1) << "Worker shut down: " << status;
	}
}

void ReexecTopology::ExitProcess(int code) {
	FlushAndExit(code);
}

} // namespace Flotilla
