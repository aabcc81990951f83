#pragma once

#include "event-stack/core/timestamp.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace eventstack::core {

struct Event {
	Timestamp start;
	Timestamp end;
	std::string name;

	Duration duration() const {
		return end - start;
	}
};

/**
 * @struct EventSet
 * @brief Start and end times plus the parallel per-event override arrays.
 *
 * Every parallel array is either empty, meaning "derive it", or as long as
 * the start times. Instances assembled field by field may break that rule;
 * IntervalValidator reports which part is inconsistent.
 */
struct EventSet {
	std::vector<Timestamp> starts;
	std::vector<Timestamp> ends;
	std::vector<std::string> names;
	std::vector<double> y_values;
	std::vector<double> color_values;

	/**
	 * @brief Builds a set from matching start and end times.
	 * @throws ChartInputError On length mismatch or when an end precedes its start.
	 */
	static EventSet fromEndTimes(std::vector<Timestamp> starts, std::vector<Timestamp> ends,
	                             std::vector<std::string> names = {});

	/**
	 * @brief Builds a set from start times and durations; end = start + duration.
	 * @throws ChartInputError On length mismatch or a negative duration.
	 */
	static EventSet fromDurations(std::vector<Timestamp> starts, const std::vector<Duration> &durations,
	                              std::vector<std::string> names = {});

	std::size_t size() const {
		return starts.size();
	}

	bool empty() const {
		return starts.empty();
	}

	Event at(std::size_t index) const;

	/// end - start per event. Requires starts and ends to have equal length.
	std::vector<Duration> durations() const;
};

} // namespace eventstack::core
