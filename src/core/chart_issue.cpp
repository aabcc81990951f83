#include "event-stack/core/chart_issue.hpp"

namespace eventstack::core {

std::string toString(IssueKind kind) {
	switch (kind) {
	case IssueKind::SizeMismatch:
		return "SizeMismatch";
	case IssueKind::NegativeDuration:
		return "NegativeDuration";
	case IssueKind::YValueSizeMismatch:
		return "YValueSizeMismatch";
	case IssueKind::ColorDataSizeMismatch:
		return "ColorDataSizeMismatch";
	case IssueKind::NameSizeMismatch:
		return "NameSizeMismatch";
	case IssueKind::PeriodTooNarrow:
		return "PeriodTooNarrow";
	case IssueKind::InvalidLimits:
		return "InvalidLimits";
	case IssueKind::InvalidInput:
		return "InvalidInput";
	case IssueKind::TimeZoneIgnored:
		return "TimeZoneIgnored";
	default:
		return "Unknown";
	}
}

} // namespace eventstack::core
