#pragma once

#include <chrono>

namespace eventstack::core {

/**
 * @struct EngineConfig
 * @brief Tunable thresholds for period selection and rendering.
 *
 * The tolerances allow one extra hour for a daylight-saving shift inside the
 * representative day and one extra day for leap years.
 */
struct EngineConfig {
	/// Auto period picks Day when the longest event is at most this long.
	std::chrono::hours auto_day_threshold{24};
	/// Longest event a Day period accepts.
	std::chrono::hours day_tolerance{25};
	/// Longest event a Year period accepts.
	std::chrono::hours year_tolerance{366 * 24};
	double marker_size = 4.0;

	/// @throws ChartInputError When a threshold is non-positive or the tolerances are inconsistent.
	void validate() const;
};

} // namespace eventstack::core
