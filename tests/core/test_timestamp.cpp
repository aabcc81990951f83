#include <catch2/catch_test_macros.hpp>

#include "event-stack/core/chart_issue.hpp"
#include "event-stack/core/timestamp.hpp"
#include "common/event_helpers.hpp"

#include <chrono>

using eventstack::core::ChartInputError;
using eventstack::core::TimeZoneInfo;
using eventstack::core::Timestamp;
using tests::helpers::at;
using tests::helpers::wall;
using tests::helpers::zoned;

TEST_CASE("Timestamp without zone uses the wall clock as instant", "[core][timestamp]") {
	const auto ts = at(2024, 5, 1, 8, 15);
	REQUIRE_FALSE(ts.hasZone());
	REQUIRE(ts.instant() == ts.wall());
	REQUIRE(ts.instant() == wall(2024, 5, 1, 8, 15));
}

TEST_CASE("Timestamp applies the UTC offset for its instant", "[core][timestamp]") {
	const auto berlin = zoned(2024, 5, 1, 10, 0, 120);
	const auto utc = at(2024, 5, 1, 8, 0);

	REQUIRE(berlin.hasZone());
	REQUIRE(berlin.wall() == wall(2024, 5, 1, 10, 0));
	REQUIRE(berlin.instant() == utc.instant());
	REQUIRE(berlin == utc);
	REQUIRE(berlin - at(2024, 5, 1, 7, 0) == std::chrono::hours(1));

	const auto stripped = berlin.withoutZone();
	REQUIRE_FALSE(stripped.hasZone());
	REQUIRE(stripped.wall() == berlin.wall());
}

TEST_CASE("Timestamp keeps its zone when shifted", "[core][timestamp]") {
	const auto start = zoned(2024, 5, 1, 23, 0, -300, "America/New_York");
	const auto shifted = start + std::chrono::hours(2);
	REQUIRE(shifted.hasZone());
	REQUIRE(shifted.zone()->name == "America/New_York");
	REQUIRE(shifted.wall() == wall(2024, 5, 2, 1, 0));
	REQUIRE(shifted - start == std::chrono::hours(2));
}

TEST_CASE("Timestamp validates zone information", "[core][timestamp][error]") {
	REQUIRE_THROWS_AS(Timestamp(wall(2024, 1, 1), TimeZoneInfo{"", std::nullopt}), ChartInputError);
	REQUIRE_THROWS_AS(Timestamp(wall(2024, 1, 1), TimeZoneInfo{"Nowhere", std::chrono::minutes(25 * 60)}),
	                  ChartInputError);
	REQUIRE_NOTHROW(Timestamp(wall(2024, 1, 1), TimeZoneInfo{"Local", std::nullopt}));
}
