#ifndef FLOTILLA_SRC_TRANSPORT_EVENT_CONFIG_H_
#define FLOTILLA_SRC_TRANSPORT_EVENT_CONFIG_H_

#include <cstdint>
#include <ostream>
#include <string>

namespace Flotilla {

// When a worker's application state is written to its state slot.
enum class ShouldSaveState {
	Always,     // on restart and on clean exit
	OnRestart,  // only when the worker is about to be restarted
	Never,
};

// Accepts always, on_restart and never. Throws ConfigError otherwise.
ShouldSaveState ParseShouldSaveState(const std::string& value);
const char* ToString(ShouldSaveState policy);

inline bool SavesOnRestart(ShouldSaveState policy) {
	return policy != ShouldSaveState::Never;
}

inline bool SavesOnExit(ShouldSaveState policy) {
	return policy == ShouldSaveState::Always;
}

enum class ClientKind {
	Client,
	Main,
	Secondary,
	PeerBroker,
};

const char* ToString(ClientKind kind);

enum class EventKind {
	NewTestcase,
	ClientStats,
	Log,
};

struct ClientStats {
	uint64_t executions = 0;
	uint64_t corpus_size = 0;
	uint64_t objective_size = 0;
};

std::ostream& operator<<(std::ostream& os, ShouldSaveState policy);
std::ostream& operator<<(std::ostream& os, ClientKind kind);

} // namespace Flotilla

#endif  // FLOTILLA_SRC_TRANSPORT_EVENT_CONFIG_H_
