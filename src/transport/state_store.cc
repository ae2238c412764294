#include "state_store.h"

#include <cerrno>
#include <cstring>

#include <glog/logging.h>

#include "common/errors.h"

namespace Flotilla {

namespace {

// shm names must not contain '/' past the leading one.
std::string SlotName(const std::string& configuration, CoreId core) {
	std::string sanitized = configuration;
	for (char& c : sanitized) {
		if (c == '/' || c == ' ') c = '_';
	}
	return "/flotilla_state_" + sanitized + "_" + std::to_string(core.id);
}

} // namespace

StateStore::StateStore(ShMemProvider& provider, const std::string& configuration, CoreId core,
		size_t slot_size)
	: provider_(provider),
	slot_name_(SlotName(configuration, core)),
	slot_size_(slot_size) {
		if (slot_size_ <= sizeof(SlotHeader)) {
			throw ConfigError("State slot of " + std::to_string(slot_size_) + " bytes is too small");
		}
	}

size_t StateStore::capacity() const {
	return slot_size_ - sizeof(SlotHeader);
}

std::shared_ptr<ShMem> StateStore::Attach(bool create) {
	if (slot_) {
		return slot_;
	}
	try {
		slot_ = provider_.ShMemByName(slot_name_, slot_size_, create);
	} catch (const ResourceError& e) {
		if (!create && e.error_code() == ENOENT) {
			return nullptr;
		}
		throw;
	}
	return slot_;
}

std::optional<std::string> StateStore::Load() {
	auto slot = Attach(false);
	if (!slot) {
		VLOG(1) << "No state slot " << slot_name_ << ", first launch";
		return std::nullopt;
	}
	SlotHeader header;
	std::memcpy(&header, slot->bytes(), sizeof(header));
	if (header.magic != kMagic || header.length == 0) {
		return std::nullopt;
	}
	if (header.length > capacity()) {
		LOG(WARNING) << "State slot " << slot_name_ << " claims " << header.length
			<< " bytes, more than its capacity; ignoring it";
		return std::nullopt;
	}
	VLOG(1) << "Restored " << header.length << " bytes of state from " << slot_name_;
	return std::string(reinterpret_cast<const char*>(slot->bytes() + sizeof(header)), header.length);
}

void StateStore::Save(const std::string& state) {
	if (state.size() > capacity()) {
		throw ResourceError("State of " + std::to_string(state.size()) + " bytes exceeds slot "
				+ slot_name_ + " (" + std::to_string(capacity()) + " bytes)");
	}
	auto slot = Attach(true);
	SlotHeader header{kMagic, state.size()};
	std::memcpy(slot->bytes() + sizeof(header), state.data(), state.size());
	std::memcpy(slot->bytes(), &header, sizeof(header));
	VLOG(2) << "Saved " << state.size() << " bytes of state to " << slot_name_;
}

void StateStore::Clear() {
	slot_.reset();
	provider_.Unlink(slot_name_);
}

} // namespace Flotilla
