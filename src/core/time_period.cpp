#include "event-stack/core/time_period.hpp"

#include "event-stack/core/chart_issue.hpp"

#include <algorithm>
#include <cctype>

namespace eventstack::core {

namespace {

std::string lowered(std::string_view text) {
	std::string result(text);
	std::transform(result.begin(), result.end(), result.begin(),
	               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return result;
}

} // namespace

TimePeriod parseTimePeriod(std::string_view text) {
	const auto value = lowered(text);
	if (value == "day") {
		return TimePeriod::Day;
	}
	if (value == "year") {
		return TimePeriod::Year;
	}
	throw ChartInputError(IssueKind::InvalidInput,
	                      "Time period must be \"day\" or \"year\", got \"" + std::string(text) + "\".");
}

std::string toString(TimePeriod period) {
	switch (period) {
	case TimePeriod::Day:
		return "day";
	case TimePeriod::Year:
		return "year";
	default:
		return "?";
	}
}

std::string tickLabelFormat(TimePeriod period) {
	return period == TimePeriod::Day ? "HH:mm" : "MMM";
}

std::string displayFormat(TimePeriod period) {
	return period == TimePeriod::Day ? "h:mm a" : "dd MM, yyyy";
}

} // namespace eventstack::core
