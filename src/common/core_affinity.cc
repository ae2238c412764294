#include "core_affinity.h"

#include <sched.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <stdexcept>
#include <sstream>

#include <glog/logging.h>

#include "errors.h"

namespace Flotilla {

namespace {

size_t ParseCoreNumber(const std::string& text, const std::string& whole) {
	if (text.empty() || !std::all_of(text.begin(), text.end(),
				[](unsigned char c) { return std::isdigit(c); })) {
		throw ConfigError("Invalid core '" + text + "' in core list '" + whole + "'");
	}
	// Capped while parsing so a huge range never gets expanded.
	size_t id = 0;
	for (char c : text) {
		id = id * 10 + static_cast<size_t>(c - '0');
		if (id >= CPU_SETSIZE) {
			throw ConfigError("Core '" + text + "' in '" + whole + "' is not below CPU_SETSIZE ("
					+ std::to_string(CPU_SETSIZE) + ")");
		}
	}
	return id;
}

std::string Trim(const std::string& s) {
	size_t begin = s.find_first_not_of(" \t");
	if (begin == std::string::npos) return "";
	size_t end = s.find_last_not_of(" \t");
	return s.substr(begin, end - begin + 1);
}

} // namespace

void CoreId::SetAffinity() const {
	if (id >= CPU_SETSIZE) {
		throw ResourceError("Core " + std::to_string(id) + " exceeds CPU_SETSIZE");
	}
	cpu_set_t mask;
	CPU_ZERO(&mask);
	CPU_SET(id, &mask);
	if (sched_setaffinity(0, sizeof(mask), &mask) == -1) {
		int err = errno;
		LOG(ERROR) << "sched_setaffinity to core " << id << " failed: " << strerror(err);
		throw ResourceError("Binding to core " + std::to_string(id), err);
	}
	VLOG(1) << "Bound to core " << id;
}

std::ostream& operator<<(std::ostream& os, const CoreId& core) {
	return os << core.id;
}

std::vector<CoreId> GetCoreIds() {
	cpu_set_t mask;
	CPU_ZERO(&mask);

	if (sched_getaffinity(0, sizeof(mask), &mask) == -1) {
		int err = errno;
		LOG(ERROR) << "sched_getaffinity failed: " << strerror(err);
		throw ResourceError("Enumerating cores", err);
	}

	std::vector<CoreId> cores;
	for (int i = 0; i < CPU_SETSIZE; i++) {
		if (CPU_ISSET(i, &mask)) {
			cores.emplace_back(static_cast<size_t>(i));
		}
	}
	if (cores.empty()) {
		throw ResourceError("Affinity mask of this process is empty");
	}
	return cores;
}

Cores::Cores(std::vector<CoreId> ids) : ids_(std::move(ids)) {
	std::sort(ids_.begin(), ids_.end());
	ids_.erase(std::unique(ids_.begin(), ids_.end()), ids_.end());
}

Cores Cores::FromCmdline(const std::string& args) {
	std::string trimmed = Trim(args);
	if (trimmed.empty()) {
		throw ConfigError("Empty core list");
	}
	if (trimmed == "all") {
		return All();
	}

	std::vector<CoreId> ids;
	std::stringstream ss(trimmed);
	std::string item;
	while (std::getline(ss, item, ',')) {
		item = Trim(item);
		if (item.empty()) {
			throw ConfigError("Empty item in core list '" + args + "'");
		}
		size_t dash = item.find('-');
		if (dash == std::string::npos) {
			ids.emplace_back(ParseCoreNumber(item, args));
			continue;
		}
		size_t from = ParseCoreNumber(Trim(item.substr(0, dash)), args);
		size_t to = ParseCoreNumber(Trim(item.substr(dash + 1)), args);
		if (from > to) {
			throw ConfigError("Reversed core range '" + item + "'");
		}
		for (size_t c = from; c <= to; ++c) {
			ids.emplace_back(c);
		}
	}
	// A trailing comma leaves getline with nothing to report.
	if (trimmed.back() == ',') {
		throw ConfigError("Empty item in core list '" + args + "'");
	}
	return Cores(std::move(ids));
}

Cores Cores::All() {
	return Cores(GetCoreIds());
}

bool Cores::Contains(CoreId core) const {
	return std::binary_search(ids_.begin(), ids_.end(), core);
}

std::optional<size_t> Cores::Position(CoreId core) const {
	auto it = std::lower_bound(ids_.begin(), ids_.end(), core);
	if (it == ids_.end() || *it != core) {
		return std::nullopt;
	}
	return static_cast<size_t>(it - ids_.begin());
}

std::string Cores::ToString() const {
	std::ostringstream os;
	os << *this;
	return os.str();
}

std::ostream& operator<<(std::ostream& os, const Cores& cores) {
	os << "[";
	for (size_t i = 0; i < cores.ids().size(); ++i) {
		if (i) os << ", ";
		os << cores.ids()[i];
	}
	return os << "]";
}

} // namespace Flotilla
