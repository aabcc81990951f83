#include <catch2/catch_test_macros.hpp>

#include "event-stack/utils/calendar.hpp"

#include <chrono>

using eventstack::utils::CivilTime;
using eventstack::utils::fromCivil;
using eventstack::utils::makeTimePoint;
using eventstack::utils::toCivil;

TEST_CASE("Calendar splits a time point into civil fields", "[utils][calendar]") {
	const auto tp = makeTimePoint(2024, 7, 14, 18, 5, 42) + std::chrono::milliseconds(250);
	const auto civil = toCivil(tp);

	REQUIRE(civil.year == 2024);
	REQUIRE(civil.month == 7);
	REQUIRE(civil.day == 14);
	REQUIRE(civil.hour == 18);
	REQUIRE(civil.minute == 5);
	REQUIRE(civil.second == 42);
	REQUIRE(civil.subsecond == std::chrono::milliseconds(250));
	REQUIRE(fromCivil(civil) == tp);
}

TEST_CASE("Calendar handles the epoch and earlier dates", "[utils][calendar]") {
	REQUIRE(makeTimePoint(1970, 1, 1).time_since_epoch().count() == 0);

	const auto civil = toCivil(makeTimePoint(1969, 12, 31, 23, 59, 59));
	REQUIRE(civil.year == 1969);
	REQUIRE(civil.month == 12);
	REQUIRE(civil.day == 31);
	REQUIRE(civil.second == 59);
}

TEST_CASE("Calendar rolls over out-of-range days", "[utils][calendar]") {
	CivilTime leap_day;
	leap_day.year = 2023;
	leap_day.month = 2;
	leap_day.day = 29;

	const auto civil = toCivil(fromCivil(leap_day));
	REQUIRE(civil.year == 2023);
	REQUIRE(civil.month == 3);
	REQUIRE(civil.day == 1);

	REQUIRE(makeTimePoint(2024, 2, 29) + std::chrono::hours(24) == makeTimePoint(2024, 3, 1));
}
