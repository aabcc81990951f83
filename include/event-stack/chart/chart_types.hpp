#pragma once

#include "event-stack/core/timestamp.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace eventstack::chart {

enum class Marker {
	None,
	Circle,
	Asterisk,
	Plus,
	Pentagram,
	Hexagram,
	TriangleUp,
	TriangleDown,
	TriangleRight,
	TriangleLeft,
	Cross,
	Square,
	Diamond,
	Point,
	VerticalLine,
	HorizontalLine
};

/// Parses a marker symbol ("o", "*", "+", "p", "h", "^", "v", ">", "<", "x", "s", "d", ".", "|", "_" or "none").
Marker parseMarker(std::string_view symbol);

std::string toString(Marker marker);

/// Passthrough styling handed to the renderer; no effect on geometry.
struct LineStyle {
	Marker marker = Marker::None;
	double line_width = 1.5;
	/// Unset means the engine's configured marker size.
	std::optional<double> marker_size;

	/// @throws ChartInputError If the line width or a set marker size is not positive.
	void validate() const;
};

struct ChartLabels {
	std::string title;
	std::string x_label;
	std::string y_label;
	std::string colorbar_label;
};

struct XLimits {
	core::TimePoint lower{};
	core::TimePoint upper{};

	/// @throws ChartInputError (InvalidLimits) unless lower < upper.
	static XLimits make(core::TimePoint lower, core::TimePoint upper);
};

struct YLimits {
	double lower = 0.0;
	double upper = 1.0;

	/// @throws ChartInputError (InvalidLimits) unless lower < upper and both are finite.
	static YLimits make(double lower, double upper);
};

} // namespace eventstack::chart
