#ifndef FLOTILLA_SRC_LAUNCHER_ONE_SHOT_H_
#define FLOTILLA_SRC_LAUNCHER_ONE_SHOT_H_

#include <optional>
#include <stdexcept>
#include <utility>

namespace Flotilla {

/**
 * Holds a value that may be taken out exactly once. A worker consumes its
 * callback the moment it knows its role; a second Take() is a bug.
 */
template<typename F>
class OneShot {
	public:
		OneShot() = default;
		explicit OneShot(F value) : value_(std::move(value)) {}

		// Empty std::function values count as absent.
		bool present() const {
			return value_.has_value() && static_cast<bool>(*value_);
		}

		// Throws std::logic_error when already taken or never set.
		F Take() {
			if (!value_) {
				throw std::logic_error("OneShot value already consumed");
			}
			F value = std::move(*value_);
			value_.reset();
			return value;
		}

	private:
		std::optional<F> value_;
};

} // namespace Flotilla

#endif  // FLOTILLA_SRC_LAUNCHER_ONE_SHOT_H_
