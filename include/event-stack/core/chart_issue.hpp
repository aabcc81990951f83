#pragma once

#include "event-stack/core/time_period.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace eventstack::core {

/**
 * @brief Conditions the chart can report about its inputs.
 *
 * Recompute-time conditions are returned as a ChartIssue and recorded as
 * advisories. Call-time conditions are thrown as ChartInputError.
 */
enum class IssueKind {
	SizeMismatch,
	NegativeDuration,
	YValueSizeMismatch,
	ColorDataSizeMismatch,
	NameSizeMismatch,
	PeriodTooNarrow,
	InvalidLimits,
	InvalidInput,
	TimeZoneIgnored
};

std::string toString(IssueKind kind);

struct ChartIssue {
	IssueKind kind = IssueKind::InvalidInput;
	std::string message;
	/// Set for PeriodTooNarrow: the period that could not hold the data.
	std::optional<TimePeriod> period;

	static ChartIssue make(IssueKind kind, std::string message) {
		return ChartIssue{kind, std::move(message), std::nullopt};
	}

	static ChartIssue periodTooNarrow(TimePeriod period, std::string message) {
		return ChartIssue{IssueKind::PeriodTooNarrow, std::move(message), period};
	}
};

/**
 * @class ChartInputError
 * @brief Thrown when an argument is rejected before any chart state is touched.
 */
class ChartInputError : public std::invalid_argument {
public:
	ChartInputError(IssueKind kind, const std::string &message) : std::invalid_argument(message), kind_(kind) {
	}

	IssueKind kind() const noexcept {
		return kind_;
	}

private:
	IssueKind kind_;
};

} // namespace eventstack::core
