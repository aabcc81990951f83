#pragma once

#include "event-stack/core/timestamp.hpp"
#include "event-stack/normalize/cyclic_normalizer.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace eventstack::geometry {

inline constexpr std::size_t kSegmentPoints = 5;

/**
 * @struct RenderSegment
 * @brief Polyline for one event on the normalized axis.
 *
 * X holds [cycle start, earlier, midpoint, later, cycle end]. An absent Y
 * tells the renderer to lift the pen, so an event is drawn either as one
 * stretch between earlier and later or, when it wraps past the cycle
 * boundary, as two stubs running in from the axis edges.
 */
struct RenderSegment {
	std::array<core::TimePoint, kSegmentPoints> x{};
	std::array<std::optional<double>, kSegmentPoints> y{};
	std::string label;

	bool wraps() const {
		return y[0].has_value();
	}
};

/**
 * @brief Builds one RenderSegment per event.
 * @param normalized_starts Starts projected onto the cycle.
 * @param normalized_ends Ends projected onto the cycle.
 * @param durations Real event durations (end - start before normalization).
 * @param y_values Vertical position per event.
 * @param window The shared cycle window.
 * @param labels Optional per-event annotation; empty or one per event.
 * @throws std::invalid_argument If the per-event inputs differ in length.
 */
std::vector<RenderSegment> generateSegments(const std::vector<core::TimePoint> &normalized_starts,
                                            const std::vector<core::TimePoint> &normalized_ends,
                                            const std::vector<core::Duration> &durations,
                                            const std::vector<double> &y_values,
                                            const normalize::CycleWindow &window,
                                            const std::vector<std::string> &labels = {});

} // namespace eventstack::geometry
