#include "event-stack/geometry/segment_generator.hpp"

#include <algorithm>
#include <stdexcept>

namespace eventstack::geometry {

std::vector<RenderSegment> generateSegments(const std::vector<core::TimePoint> &normalized_starts,
                                            const std::vector<core::TimePoint> &normalized_ends,
                                            const std::vector<core::Duration> &durations,
                                            const std::vector<double> &y_values,
                                            const normalize::CycleWindow &window,
                                            const std::vector<std::string> &labels) {
	const std::size_t count = normalized_starts.size();
	if (normalized_ends.size() != count || durations.size() != count || y_values.size() != count) {
		throw std::invalid_argument("Segment inputs must have one entry per event.");
	}
	if (!labels.empty() && labels.size() != count) {
		throw std::invalid_argument("Segment labels must be empty or have one entry per event.");
	}

	std::vector<RenderSegment> segments(count);
	for (std::size_t i = 0; i < count; ++i) {
		const auto &start = normalized_starts[i];
		const auto &end = normalized_ends[i];
		const auto earlier = std::min(start, end);
		const auto later = std::max(start, end);
		const double value = y_values[i];

		auto &segment = segments[i];
		segment.x = {window.start, earlier, earlier + durations[i] / 2, later, window.end};
		segment.y[1] = value;
		segment.y[3] = value;

		if (start > end) {
			// Crosses the cycle boundary: two stubs from the axis edges.
			segment.y[0] = value;
			segment.y[4] = value;
		} else {
			segment.y[2] = value;
		}

		if (!labels.empty()) {
			segment.label = labels[i];
		}
	}
	return segments;
}

} // namespace eventstack::geometry
