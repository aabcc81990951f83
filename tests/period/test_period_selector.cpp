#include <catch2/catch_test_macros.hpp>

#include "event-stack/period/period_selector.hpp"

#include <chrono>
#include <vector>

using eventstack::core::Duration;
using eventstack::core::EngineConfig;
using eventstack::core::IssueKind;
using eventstack::core::TimePeriod;
using eventstack::period::checkPeriodCapacity;
using eventstack::period::selectPeriod;
using namespace std::chrono_literals;

TEST_CASE("Period selector picks Day for events up to a day long", "[period][selector]") {
	const std::vector<Duration> durations{1h, 30min, 24h};
	REQUIRE(selectPeriod(durations, std::nullopt) == TimePeriod::Day);
	REQUIRE(selectPeriod({}, std::nullopt) == TimePeriod::Day);
}

TEST_CASE("Period selector picks Year for longer events", "[period][selector]") {
	const std::vector<Duration> durations{1h, 24h + 1s};
	REQUIRE(selectPeriod(durations, std::nullopt) == TimePeriod::Year);
}

TEST_CASE("Period selector keeps a fixed period", "[period][selector]") {
	const std::vector<Duration> durations{48h};
	REQUIRE(selectPeriod(durations, TimePeriod::Day) == TimePeriod::Day);
	REQUIRE(selectPeriod({1h}, TimePeriod::Year) == TimePeriod::Year);
}

TEST_CASE("Period capacity allows the daylight-saving and leap-year slack", "[period][capacity]") {
	REQUIRE_FALSE(checkPeriodCapacity({25h}, TimePeriod::Day).has_value());
	REQUIRE_FALSE(checkPeriodCapacity({366 * 24h}, TimePeriod::Year).has_value());
}

TEST_CASE("Period capacity reports events longer than the period", "[period][capacity][error]") {
	const auto day_issue = checkPeriodCapacity({1h, 25h + 1min}, TimePeriod::Day);
	REQUIRE(day_issue.has_value());
	REQUIRE(day_issue->kind == IssueKind::PeriodTooNarrow);
	REQUIRE(day_issue->period == TimePeriod::Day);

	const auto year_issue = checkPeriodCapacity({367 * 24h}, TimePeriod::Year);
	REQUIRE(year_issue.has_value());
	REQUIRE(year_issue->period == TimePeriod::Year);
}

TEST_CASE("Period thresholds come from the engine config", "[period][config]") {
	EngineConfig config;
	config.auto_day_threshold = 12h;
	config.day_tolerance = 12h;

	REQUIRE(selectPeriod({13h}, std::nullopt, config) == TimePeriod::Year);
	REQUIRE(checkPeriodCapacity({13h}, TimePeriod::Day, config).has_value());
	REQUIRE_NOTHROW(config.validate());

	config.day_tolerance = 6h;
	REQUIRE_THROWS(config.validate());
}
