#include "fork_topology.h"

#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <thread>

#include <glog/logging.h>

#include "common/errors.h"
#include "launch_config.h"

namespace Flotilla {

pid_t DuplicateProcess(ShMemProvider& provider) {
	// Buffered output would otherwise be written twice.
	std::fflush(nullptr);
	provider.PreFork();
	pid_t pid = fork();
	int err = errno;
	if (pid < 0) {
		provider.PostFork(false);
		LOG(ERROR) << "fork() failed: " << std::strerror(err);
		throw ResourceError("fork", err);
	}
	provider.PostFork(pid == 0);
	return pid;
}

SpawnResult ForkTopology::Spawn(const SpawnRequest& request) {
	pid_t pid = DuplicateProcess(provider_);
	if (pid > 0) {
		VLOG(1) << "Forked worker " << pid << " for core " << request.core;
		return SpawnedParent{ProcessHandle(pid, request.core)};
	}

	std::this_thread::sleep_for(request.launch_delay * request.stagger_index);
	if (request.output) {
		request.output->Apply();
	}
	return SpawnedChild{};
}

SpawnResult ForkTopology::Duplicate() {
	pid_t pid = DuplicateProcess(provider_);
	if (pid > 0) {
		return SpawnedParent{ProcessHandle(pid, CoreId())};
	}
	return SpawnedChild{};
}

std::vector<ExitStatus> ForkTopology::AwaitAll(std::vector<ProcessHandle>& handles) {
	return WaitForHandles(handles);
}

void ForkTopology::SignalShutdown(std::vector<ProcessHandle>& handles) {
	SignalHandles(handles, SIGINT);
}

void ForkTopology::ExitProcess(int code) {
	FlushAndExit(code);
}

std::vector<ExitStatus> WaitForHandles(std::vector<ProcessHandle>& handles) {
	std::vector<ExitStatus> statuses;
	statuses.reserve(handles.size());
	for (auto& handle : handles) {
		if (!handle.valid()) {
			continue;
		}
		int status = 0;
		pid_t ret;
		do {
			ret = waitpid(handle.pid(), &status, 0);
		} while (ret < 0 && errno == EINTR);
		if (ret < 0) {
			LOG(WARNING) << "waitpid(" << handle.pid() << ") failed: " << std::strerror(errno);
			continue;
		}
		statuses.push_back(ExitStatus::FromWaitStatus(handle.pid(), handle.core(), status));
		VLOG(1) << "Reaped " << statuses.back();
	}
	handles.clear();
	return statuses;
}

void SignalHandles(std::vector<ProcessHandle>& handles, int sig) {
	for (const auto& handle : handles) {
		if (!handle.valid()) {
			continue;
		}
		if (kill(handle.pid(), sig) != 0) {
			LOG(WARNING) << "Failed to send signal " << sig << " to " << handle.pid()
				<< ": " << std::strerror(errno);
			continue;
		}
		VLOG(1) << "Sent signal " << sig << " to " << handle.pid();
	}
}

void FlushAndExit(int code) {
	google::FlushLogFiles(google::GLOG_INFO);
	std::cout.flush();
	std::cerr.flush();
	std::fflush(nullptr);
	_exit(code);
}

} // namespace Flotilla
