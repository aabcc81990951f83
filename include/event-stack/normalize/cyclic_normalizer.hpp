#pragma once

#include "event-stack/core/time_period.hpp"
#include "event-stack/core/timestamp.hpp"

#include <optional>
#include <vector>

namespace eventstack::normalize {

/// The representative day or year every event is projected onto.
struct CycleWindow {
	core::TimePoint start{};
	core::TimePoint end{};

	int year() const;
};

struct NormalizedTimes {
	std::vector<core::TimePoint> values;
	/// True when at least one input carried zone information that was dropped.
	bool zone_discarded = false;
};

/**
 * @brief Projects a timestamp onto the reference cycle.
 *
 * Zone information is dropped and the wall-clock year replaced by
 * @p reference_year. For Day the month and day are also forced to
 * 1 January, leaving only the time of day meaningful.
 */
core::TimePoint normalizeTime(const core::Timestamp &timestamp, int reference_year, core::TimePeriod period);

NormalizedTimes normalizeTimes(const std::vector<core::Timestamp> &timestamps, int reference_year,
                               core::TimePeriod period);

/**
 * @brief Derives the cycle window from the earliest start.
 * @return std::nullopt for an empty input.
 */
std::optional<CycleWindow> makeCycleWindow(const std::vector<core::Timestamp> &starts, core::TimePeriod period);

} // namespace eventstack::normalize
