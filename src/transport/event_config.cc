#include "event_config.h"

#include "common/errors.h"

namespace Flotilla {

ShouldSaveState ParseShouldSaveState(const std::string& value) {
	if (value == "always") return ShouldSaveState::Always;
	if (value == "on_restart") return ShouldSaveState::OnRestart;
	if (value == "never") return ShouldSaveState::Never;
	throw ConfigError("Unknown state serialization policy: '" + value + "'");
}

const char* ToString(ShouldSaveState policy) {
	switch (policy) {
		case ShouldSaveState::Always: return "always";
		case ShouldSaveState::OnRestart: return "on_restart";
		case ShouldSaveState::Never: return "never";
	}
	return "unknown";
}

const char* ToString(ClientKind kind) {
	switch (kind) {
		case ClientKind::Client: return "client";
		case ClientKind::Main: return "main";
		case ClientKind::Secondary: return "secondary";
		case ClientKind::PeerBroker: return "peer_broker";
	}
	return "unknown";
}

std::ostream& operator<<(std::ostream& os, ShouldSaveState policy) {
	return os << ToString(policy);
}

std::ostream& operator<<(std::ostream& os, ClientKind kind) {
	return os << ToString(kind);
}

} // namespace Flotilla
