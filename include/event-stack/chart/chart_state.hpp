#pragma once

#include "event-stack/chart/chart_types.hpp"
#include "event-stack/core/time_period.hpp"

#include <optional>
#include <vector>

namespace eventstack::chart {

/**
 * @struct ChartState
 * @brief View state the host saves and restores alongside its figure.
 *
 * Only caller-controlled values are captured; anything the engine derives is
 * recomputed after a restore.
 */
struct ChartState {
	std::optional<std::vector<double>> y_values;
	std::optional<std::vector<double>> color_values;
	std::optional<core::TimePeriod> period;
	std::optional<XLimits> x_limits;
	std::optional<YLimits> y_limits;

	bool empty() const {
		return !y_values && !color_values && !period && !x_limits && !y_limits;
	}
};

} // namespace eventstack::chart
