#include "event-stack/validation/interval_validator.hpp"

#include <cstddef>
#include <string>

namespace eventstack::validation {

namespace {

bool overrideMatches(std::size_t override_size, std::size_t count) {
    return override_size == 0 || override_size == count;
}

} // namespace

std::optional<core::ChartIssue> validateIntervals(const core::EventSet &events) {
    using core::ChartIssue;
    using core::IssueKind;

    const std::size_t count = events.starts.size();
    if (events.ends.size() != count) {
        return ChartIssue::make(IssueKind::SizeMismatch,
                                "EndTimes must have the same number of elements as StartTimes.");
    }

    for (std::size_t i = 0; i < count; ++i) {
        if (events.ends[i] < events.starts[i]) {
            return ChartIssue::make(IssueKind::NegativeDuration,
                                    "EndTimes must be greater than or equal to StartTimes (event " +
                                        std::to_string(i) + ").");
        }
    }

    if (!overrideMatches(events.y_values.size(), count)) {
        return ChartIssue::make(IssueKind::YValueSizeMismatch,
                                "YData must have the same number of elements as StartTimes.");
    }
    if (!overrideMatches(events.color_values.size(), count)) {
        return ChartIssue::make(IssueKind::ColorDataSizeMismatch,
                                "ColorData must have the same number of elements as StartTimes.");
    }
    if (!overrideMatches(events.names.size(), count)) {
        return ChartIssue::make(IssueKind::NameSizeMismatch,
                                "EventNames must have the same number of elements as StartTimes.");
    }
    return std::nullopt;
}

} // namespace eventstack::validation
