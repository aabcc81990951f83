#include <catch2/catch_test_macros.hpp>

#include "event-stack/chart/chart_types.hpp"
#include "event-stack/core/chart_issue.hpp"
#include "common/event_helpers.hpp"

#include <limits>
#include <string>

using eventstack::chart::LineStyle;
using eventstack::chart::Marker;
using eventstack::chart::parseMarker;
using eventstack::chart::XLimits;
using eventstack::chart::YLimits;
using eventstack::core::ChartInputError;
using eventstack::core::IssueKind;
using tests::helpers::wall;

TEST_CASE("Marker symbols parse and print back", "[chart][types][marker]") {
	for (const std::string symbol : {"o", "*", "+", "p", "h", "^", "v", ">", "<", "x", "s", "d", ".", "|", "_", "none"}) {
		REQUIRE(eventstack::chart::toString(parseMarker(symbol)) == symbol);
	}
	REQUIRE(parseMarker("none") == Marker::None);
	REQUIRE(parseMarker("d") == Marker::Diamond);
	REQUIRE_THROWS_AS(parseMarker("square"), ChartInputError);
	REQUIRE_THROWS_AS(parseMarker(""), ChartInputError);
}

TEST_CASE("Line style defaults and validation", "[chart][types][style]") {
	LineStyle style;
	REQUIRE(style.marker == Marker::None);
	REQUIRE(style.line_width == 1.5);
	REQUIRE_FALSE(style.marker_size.has_value());
	REQUIRE_NOTHROW(style.validate());

	style.line_width = 0.0;
	REQUIRE_THROWS_AS(style.validate(), ChartInputError);

	style.line_width = 2.0;
	style.marker_size = std::numeric_limits<double>::quiet_NaN();
	REQUIRE_THROWS_AS(style.validate(), ChartInputError);
}

TEST_CASE("Axis limits must be two increasing values", "[chart][types][limits]") {
	const auto x = XLimits::make(wall(2024, 1, 1, 6), wall(2024, 1, 1, 18));
	REQUIRE(x.lower == wall(2024, 1, 1, 6));
	REQUIRE(x.upper == wall(2024, 1, 1, 18));

	const auto y = YLimits::make(-1.0, 5.0);
	REQUIRE(y.lower == -1.0);
	REQUIRE(y.upper == 5.0);

	try {
		YLimits::make(3.0, 3.0);
		FAIL("expected ChartInputError");
	} catch (const ChartInputError &error) {
		REQUIRE(error.kind() == IssueKind::InvalidLimits);
		REQUIRE(std::string(error.what()) == "Specify limits as two increasing values.");
	}
	REQUIRE_THROWS_AS(YLimits::make(2.0, 1.0), ChartInputError);
	REQUIRE_THROWS_AS(YLimits::make(0.0, std::numeric_limits<double>::infinity()), ChartInputError);
	REQUIRE_THROWS_AS(XLimits::make(wall(2024, 1, 2), wall(2024, 1, 1)), ChartInputError);
}
