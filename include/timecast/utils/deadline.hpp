#pragma once

#include "timecast/core/errors.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace timecast::utils {

/**
 * @class Deadline
 * @brief A point in time after which a candidate's work must stop.
 *
 * Deadlines are polled cooperatively: the cross-validator checks before each
 * fold and iterative models check once per training epoch. A default
 * constructed deadline never expires.
 */
class Deadline {
public:
	using Clock = std::chrono::steady_clock;

	Deadline() = default;

	static Deadline after(Clock::duration budget) {
		Deadline deadline;
		deadline.expiry_ = Clock::now() + budget;
		return deadline;
	}

	static Deadline unbounded() {
		return Deadline{};
	}

	bool bounded() const {
		return expiry_.has_value();
	}

	bool expired() const {
		return expiry_ && Clock::now() >= *expiry_;
	}

	Clock::duration remaining() const {
		if (!expiry_) {
			return Clock::duration::max();
		}
		const auto left = *expiry_ - Clock::now();
		return left > Clock::duration::zero() ? left : Clock::duration::zero();
	}

	/// @throws core::TimeoutError If the deadline has passed.
	void check(const std::string &what) const {
		if (expired()) {
			throw core::TimeoutError(what + " exceeded its time budget.");
		}
	}

private:
	std::optional<Clock::time_point> expiry_;
};

} // namespace timecast::utils
