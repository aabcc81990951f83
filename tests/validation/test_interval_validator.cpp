#include <catch2/catch_test_macros.hpp>

#include "event-stack/validation/interval_validator.hpp"
#include "common/event_helpers.hpp"

using eventstack::core::EventSet;
using eventstack::core::IssueKind;
using eventstack::validation::validateIntervals;
using tests::helpers::at;

TEST_CASE("Interval validator accepts consistent input", "[validation][intervals]") {
	auto events = tests::helpers::makeDailyEvents();
	REQUIRE_FALSE(validateIntervals(events).has_value());

	events.names = {"a", "b", "c"};
	events.y_values = {1.0, 2.0, 3.0};
	events.color_values = {0.5, 0.5, 0.5};
	REQUIRE_FALSE(validateIntervals(events).has_value());

	REQUIRE_FALSE(validateIntervals(EventSet{}).has_value());
}

TEST_CASE("Interval validator reports start/end length mismatch", "[validation][intervals][error]") {
	EventSet events;
	events.starts = {at(2024, 1, 1, 9), at(2024, 1, 2, 9), at(2024, 1, 3, 9)};
	events.ends = {at(2024, 1, 1, 10), at(2024, 1, 2, 10)};

	const auto issue = validateIntervals(events);
	REQUIRE(issue.has_value());
	REQUIRE(issue->kind == IssueKind::SizeMismatch);
}

TEST_CASE("Interval validator reports negative durations", "[validation][intervals][error]") {
	EventSet events;
	events.starts = {at(2024, 1, 1, 10)};
	events.ends = {at(2024, 1, 1, 9)};

	const auto issue = validateIntervals(events);
	REQUIRE(issue.has_value());
	REQUIRE(issue->kind == IssueKind::NegativeDuration);
}

TEST_CASE("Interval validator checks overrides in order", "[validation][intervals][error]") {
	auto events = tests::helpers::makeDailyEvents();
	events.y_values = {1.0};
	events.color_values = {1.0, 2.0};
	events.names = {"only"};
	REQUIRE(validateIntervals(events)->kind == IssueKind::YValueSizeMismatch);

	events.y_values.clear();
	REQUIRE(validateIntervals(events)->kind == IssueKind::ColorDataSizeMismatch);

	events.color_values.clear();
	REQUIRE(validateIntervals(events)->kind == IssueKind::NameSizeMismatch);

	events.names.clear();
	REQUIRE_FALSE(validateIntervals(events).has_value());
}

TEST_CASE("Interval validator stops at the first failing check", "[validation][intervals][error]") {
	EventSet events;
	events.starts = {at(2024, 1, 1, 10), at(2024, 1, 2, 10)};
	events.ends = {at(2024, 1, 1, 9)};
	events.color_values = {1.0, 2.0, 3.0};
	REQUIRE(validateIntervals(events)->kind == IssueKind::SizeMismatch);
}
