#pragma once

#include "event-stack/core/chart_issue.hpp"
#include "event-stack/core/event_set.hpp"

#include <optional>

namespace eventstack::validation {

/**
 * @brief Checks an event set for structural and semantic consistency.
 *
 * Checks run in order (start/end length, non-negative durations, Y-value
 * length, color-value length, name length) and the first failure is
 * returned. Empty override arrays are accepted.
 */
std::optional<core::ChartIssue> validateIntervals(const core::EventSet &events);

} // namespace eventstack::validation
