#include "event-stack/period/period_selector.hpp"

#include <algorithm>

namespace eventstack::period {

namespace {

core::Duration longest(const std::vector<core::Duration> &durations) {
	if (durations.empty()) {
		return core::Duration::zero();
	}
	return *std::max_element(durations.begin(), durations.end());
}

} // namespace

core::TimePeriod selectPeriod(const std::vector<core::Duration> &durations,
                              const std::optional<core::TimePeriod> &fixed, const core::EngineConfig &config) {
	if (fixed) {
		return *fixed;
	}
	return longest(durations) <= config.auto_day_threshold ? core::TimePeriod::Day : core::TimePeriod::Year;
}

std::optional<core::ChartIssue> checkPeriodCapacity(const std::vector<core::Duration> &durations,
                                                    core::TimePeriod period, const core::EngineConfig &config) {
	const auto max_duration = longest(durations);
	switch (period) {
	case core::TimePeriod::Day:
		if (max_duration > config.day_tolerance) {
			return core::ChartIssue::periodTooNarrow(
			    period, "EndTimes must be less than one full day after StartTimes when TimePeriod set to \"day\". "
			            "Consider setting TimePeriod to \"year\" instead.");
		}
		break;
	case core::TimePeriod::Year:
		if (max_duration > config.year_tolerance) {
			return core::ChartIssue::periodTooNarrow(period,
			                                         "EndTimes must be less than one full year after StartTimes.");
		}
		break;
	}
	return std::nullopt;
}

} // namespace eventstack::period
