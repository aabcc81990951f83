#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace eventstack::core {

using TimePoint = std::chrono::system_clock::time_point;
using Duration = TimePoint::duration;

struct TimeZoneInfo {
	std::string name;
	std::optional<std::chrono::minutes> utc_offset;
};

/**
 * @class Timestamp
 * @brief A wall-clock reading with optional time-zone information.
 *
 * The wall clock is stored as a system_clock time point encoded as if it were
 * UTC, so its civil fields are the local fields. When the zone carries a UTC
 * offset the absolute instant is the wall clock minus that offset; without an
 * offset the wall clock is taken as the instant.
 */
class Timestamp {
public:
	Timestamp() = default;

	explicit Timestamp(TimePoint wall) : wall_(wall) {
	}

	/**
	 * @throws ChartInputError If the zone name is empty or the offset lies outside [-24h, 24h].
	 */
	Timestamp(TimePoint wall, TimeZoneInfo zone);

	static Timestamp fromCivil(int year, int month, int day, int hour = 0, int minute = 0, int second = 0);

	const TimePoint &wall() const {
		return wall_;
	}

	const std::optional<TimeZoneInfo> &zone() const {
		return zone_;
	}

	bool hasZone() const {
		return zone_.has_value();
	}

	TimePoint instant() const;

	Timestamp withoutZone() const {
		return Timestamp(wall_);
	}

	/// Shifts the wall clock, keeping the zone.
	Timestamp operator+(Duration delta) const;

	friend Duration operator-(const Timestamp &lhs, const Timestamp &rhs) {
		return lhs.instant() - rhs.instant();
	}

	friend bool operator<(const Timestamp &lhs, const Timestamp &rhs) {
		return lhs.instant() < rhs.instant();
	}

	friend bool operator==(const Timestamp &lhs, const Timestamp &rhs) {
		return lhs.instant() == rhs.instant();
	}

	friend bool operator!=(const Timestamp &lhs, const Timestamp &rhs) {
		return !(lhs == rhs);
	}

private:
	TimePoint wall_{};
	std::optional<TimeZoneInfo> zone_;
};

} // namespace eventstack::core
