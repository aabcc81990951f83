#pragma once

#include "event-stack/core/chart_issue.hpp"
#include "event-stack/core/engine_config.hpp"
#include "event-stack/core/time_period.hpp"
#include "event-stack/core/timestamp.hpp"

#include <optional>
#include <vector>

namespace eventstack::period {

/**
 * @brief Picks the cyclic period for a set of event durations.
 * @param durations Event durations, all non-negative.
 * @param fixed The caller's period when the period is in manual mode.
 * @return @p fixed if given, otherwise Day when the longest duration fits
 *         config.auto_day_threshold and Year beyond it.
 */
core::TimePeriod selectPeriod(const std::vector<core::Duration> &durations,
                              const std::optional<core::TimePeriod> &fixed,
                              const core::EngineConfig &config = {});

/**
 * @brief Checks that every duration fits the chosen period's tolerance.
 * @return PeriodTooNarrow carrying @p period when an event is too long.
 */
std::optional<core::ChartIssue> checkPeriodCapacity(const std::vector<core::Duration> &durations,
                                                    core::TimePeriod period,
                                                    const core::EngineConfig &config = {});

} // namespace eventstack::period
