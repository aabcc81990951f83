#include <catch2/catch_test_macros.hpp>

#include "event-stack/geometry/segment_generator.hpp"
#include "common/event_helpers.hpp"

#include <chrono>
#include <stdexcept>
#include <vector>

using eventstack::core::Duration;
using eventstack::core::TimePoint;
using eventstack::geometry::generateSegments;
using eventstack::geometry::RenderSegment;
using eventstack::normalize::CycleWindow;
using tests::helpers::wall;
using namespace std::chrono_literals;

namespace {

const CycleWindow kDay{wall(2024, 1, 1), wall(2024, 1, 2)};

RenderSegment single(TimePoint start, TimePoint end, Duration duration, double y) {
	return generateSegments({start}, {end}, {duration}, {y}, kDay).front();
}

} // namespace

TEST_CASE("Segment for an ordinary event draws one stretch", "[geometry][segments]") {
	const auto segment = single(wall(2024, 1, 1, 9), wall(2024, 1, 1, 10), 1h, 1.0);

	REQUIRE(segment.x[0] == kDay.start);
	REQUIRE(segment.x[1] == wall(2024, 1, 1, 9));
	REQUIRE(segment.x[2] == wall(2024, 1, 1, 9, 30));
	REQUIRE(segment.x[3] == wall(2024, 1, 1, 10));
	REQUIRE(segment.x[4] == kDay.end);

	REQUIRE_FALSE(segment.y[0].has_value());
	REQUIRE(segment.y[1] == 1.0);
	REQUIRE(segment.y[2] == 1.0);
	REQUIRE(segment.y[3] == 1.0);
	REQUIRE_FALSE(segment.y[4].has_value());
	REQUIRE_FALSE(segment.wraps());
}

TEST_CASE("Segment for an event crossing midnight draws two stubs", "[geometry][segments][wrap]") {
	// 23:30 to 00:30 the next day, both projected onto the same day.
	const auto segment = single(wall(2024, 1, 1, 23, 30), wall(2024, 1, 1, 0, 30), 1h, 1.0);

	REQUIRE(segment.x[1] == wall(2024, 1, 1, 0, 30));
	REQUIRE(segment.x[3] == wall(2024, 1, 1, 23, 30));
	REQUIRE(segment.x[2] == wall(2024, 1, 1, 1));

	REQUIRE(segment.y[0] == 1.0);
	REQUIRE(segment.y[1] == 1.0);
	REQUIRE_FALSE(segment.y[2].has_value());
	REQUIRE(segment.y[3] == 1.0);
	REQUIRE(segment.y[4] == 1.0);
	REQUIRE(segment.wraps());
}

TEST_CASE("Zero-length events are ordinary segments", "[geometry][segments]") {
	const auto segment = single(wall(2024, 1, 1, 12), wall(2024, 1, 1, 12), Duration::zero(), 0.0);
	REQUIRE(segment.x[1] == segment.x[2]);
	REQUIRE(segment.x[2] == segment.x[3]);
	REQUIRE(segment.y[2] == 0.0);
	REQUIRE_FALSE(segment.wraps());
}

TEST_CASE("Every segment has exactly one of the two shapes", "[geometry][segments]") {
	const std::vector<TimePoint> starts{wall(2024, 1, 1, 1), wall(2024, 1, 1, 22), wall(2024, 1, 1, 6),
	                                    wall(2024, 1, 1, 18)};
	const std::vector<TimePoint> ends{wall(2024, 1, 1, 5), wall(2024, 1, 1, 2), wall(2024, 1, 1, 6, 1),
	                                  wall(2024, 1, 1, 17)};
	const std::vector<Duration> durations{4h, 4h, 1min, 23h};
	const std::vector<double> y{4.0, 4.0, 1.0 / 60.0, 23.0};

	const auto segments = generateSegments(starts, ends, durations, y, kDay, {"a", "b", "c", "d"});
	REQUIRE(segments.size() == 4);
	for (std::size_t i = 0; i < segments.size(); ++i) {
		const auto &segment = segments[i];
		REQUIRE(segment.y[1] == y[i]);
		REQUIRE(segment.y[3] == y[i]);

		const bool edges = segment.y[0].has_value() && segment.y[4].has_value();
		const bool middle = segment.y[2].has_value();
		REQUIRE(edges != middle);
		REQUIRE(edges == (starts[i] > ends[i]));

		REQUIRE(segment.x[1] <= segment.x[3]);
		REQUIRE(segment.x[2] == segment.x[1] + durations[i] / 2);
	}
	REQUIRE(segments[2].label == "c");
}

TEST_CASE("Midpoint lies between the endpoints within one day", "[geometry][segments]") {
	const auto segment = single(wall(2024, 1, 1, 7, 15), wall(2024, 1, 1, 16, 45), 9h + 30min, 9.5);
	REQUIRE(segment.x[1] <= segment.x[2]);
	REQUIRE(segment.x[2] <= segment.x[3]);
	REQUIRE(segment.x[2] == wall(2024, 1, 1, 12));
}

TEST_CASE("Segment generation rejects misaligned inputs", "[geometry][segments][error]") {
	REQUIRE_THROWS_AS(generateSegments({wall(2024, 1, 1)}, {}, {1h}, {1.0}, kDay), std::invalid_argument);
	REQUIRE_THROWS_AS(generateSegments({wall(2024, 1, 1)}, {wall(2024, 1, 1)}, {1h}, {1.0}, kDay, {"a", "b"}),
	                  std::invalid_argument);
	REQUIRE(generateSegments({}, {}, {}, {}, kDay).empty());
}
