#include "event-stack/chart/chart_types.hpp"

#include "event-stack/core/chart_issue.hpp"

#include <array>
#include <cmath>
#include <utility>

namespace eventstack::chart {

namespace {

const std::array<std::pair<std::string_view, Marker>, 16> kMarkerSymbols{{
    {"none", Marker::None},
    {"o", Marker::Circle},
    {"*", Marker::Asterisk},
    {"+", Marker::Plus},
    {"p", Marker::Pentagram},
    {"h", Marker::Hexagram},
    {"^", Marker::TriangleUp},
    {"v", Marker::TriangleDown},
    {">", Marker::TriangleRight},
    {"<", Marker::TriangleLeft},
    {"x", Marker::Cross},
    {"s", Marker::Square},
    {"d", Marker::Diamond},
    {".", Marker::Point},
    {"|", Marker::VerticalLine},
    {"_", Marker::HorizontalLine},
}};

} // namespace

Marker parseMarker(std::string_view symbol) {
	for (const auto &entry : kMarkerSymbols) {
		if (entry.first == symbol) {
			return entry.second;
		}
	}
	throw core::ChartInputError(core::IssueKind::InvalidInput,
	                            "Unsupported marker \"" + std::string(symbol) + "\".");
}

std::string toString(Marker marker) {
	for (const auto &entry : kMarkerSymbols) {
		if (entry.second == marker) {
			return std::string(entry.first);
		}
	}
	return "none";
}

void LineStyle::validate() const {
	if (!(line_width > 0.0) || !std::isfinite(line_width)) {
		throw core::ChartInputError(core::IssueKind::InvalidInput, "LineWidth must be positive.");
	}
	if (marker_size && (!(*marker_size > 0.0) || !std::isfinite(*marker_size))) {
		throw core::ChartInputError(core::IssueKind::InvalidInput, "MarkerSize must be positive.");
	}
}

XLimits XLimits::make(core::TimePoint lower, core::TimePoint upper) {
	if (!(lower < upper)) {
		throw core::ChartInputError(core::IssueKind::InvalidLimits, "Specify limits as two increasing values.");
	}
	return XLimits{lower, upper};
}

YLimits YLimits::make(double lower, double upper) {
	if (!std::isfinite(lower) || !std::isfinite(upper) || !(lower < upper)) {
		throw core::ChartInputError(core::IssueKind::InvalidLimits, "Specify limits as two increasing values.");
	}
	return YLimits{lower, upper};
}

} // namespace eventstack::chart
