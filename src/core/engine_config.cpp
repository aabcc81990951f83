#include "event-stack/core/engine_config.hpp"

#include "event-stack/core/chart_issue.hpp"

namespace eventstack::core {

void EngineConfig::validate() const {
	if (auto_day_threshold.count() <= 0 || day_tolerance.count() <= 0 || year_tolerance.count() <= 0) {
		throw ChartInputError(IssueKind::InvalidInput, "Period thresholds must be positive.");
	}
	if (day_tolerance < auto_day_threshold) {
		throw ChartInputError(IssueKind::InvalidInput, "Day tolerance must not be shorter than the auto day threshold.");
	}
	if (year_tolerance <= day_tolerance) {
		throw ChartInputError(IssueKind::InvalidInput, "Year tolerance must exceed the day tolerance.");
	}
	if (!(marker_size > 0.0)) {
		throw ChartInputError(IssueKind::InvalidInput, "Marker size must be positive.");
	}
}

} // namespace eventstack::core
