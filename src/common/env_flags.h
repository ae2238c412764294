#pragma once

#include <cstdlib>
#include <optional>
#include <string>

namespace Flotilla {

/// Set on re-exec children; holds the core index the child is bound to.
constexpr char kLauncherClientEnv[] = "FLOTILLA_LAUNCHER_CLIENT";
/// Presence disables stdout/stderr redirection of every spawned process.
constexpr char kDebugOutputEnv[] = "FLOTILLA_DEBUG_OUTPUT";

// Presence check only; the value (even an empty one) is ignored.
inline bool IsEnvPresent(const char* env_name) {
	return std::getenv(env_name) != nullptr;
}

inline std::optional<std::string> ReadEnvString(const char* env_name) {
	const char* env = std::getenv(env_name);
	if (!env) return std::nullopt;
	return std::string(env);
}

inline bool DebugOutputRequested() {
	return IsEnvPresent(kDebugOutputEnv);
}

}  // namespace Flotilla
