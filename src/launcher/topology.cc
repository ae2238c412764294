#include "topology.h"

#include <sys/wait.h>

#include <cstring>

#include "fork_topology.h"
#include "reexec_topology.h"

namespace Flotilla {

ExitStatus ExitStatus::FromWaitStatus(pid_t pid, CoreId core, int status) {
	ExitStatus exit_status;
	exit_status.pid = pid;
	exit_status.core = core;
	if (WIFEXITED(status)) {
		exit_status.exited = true;
		exit_status.code = WEXITSTATUS(status);
	} else if (WIFSIGNALED(status)) {
		exit_status.signal = WTERMSIG(status);
	}
	return exit_status;
}

std::ostream& operator<<(std::ostream& os, const ExitStatus& status) {
	os << "pid " << status.pid << " (core " << status.core << ") ";
	if (status.exited) {
		os << "exited with " << status.code;
	} else {
		os << "killed by signal " << status.signal << " (" << strsignal(status.signal) << ")";
	}
	return os;
}

std::unique_ptr<Topology> MakeDefaultTopology(ShMemProvider& provider) {
#ifdef FLOTILLA_USE_FORK
	return std::make_unique<ForkTopology>(provider);
#else
	(void)provider;
	return std::make_unique<ReexecTopology>();
#endif
}

} // namespace Flotilla
