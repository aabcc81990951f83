#pragma once

#include "event-stack/chart/chart_types.hpp"
#include "event-stack/color/color_mapper.hpp"
#include "event-stack/geometry/segment_generator.hpp"

#include <optional>
#include <string>
#include <vector>

namespace eventstack::chart {

/**
 * @class IChartRenderer
 * @brief The host drawing surface the engine pushes frames into.
 *
 * Implementations own pixels, interaction and the colorbar widget. The
 * engine only calls these methods from ChartDataEngine::render.
 */
class IChartRenderer {
public:
	virtual ~IChartRenderer() = default;

	/**
	 * @brief Replaces every line on the surface with one polyline per segment.
	 *
	 * An absent Y value breaks the polyline: the points on either side are not joined.
	 */
	virtual void drawPolylines(const std::vector<geometry::RenderSegment> &segments) = 0;

	/// One color per polyline, in the order passed to drawPolylines.
	virtual void setLineColors(const std::vector<color::Rgb> &colors) = 0;

	virtual void setLineStyle(const LineStyle &style) = 0;

	/// "HH:mm" for a daily axis, "MMM" for a yearly one.
	virtual void setTickLabelFormat(const std::string &format) = 0;

	/// Format for normalized times shown in data tips: "h:mm a" daily, "dd MM, yyyy" yearly.
	virtual void setValueDisplayFormat(const std::string &format) = 0;

	/// std::nullopt leaves the axis on automatic limits.
	virtual void setLimits(const std::optional<XLimits> &x_limits, const std::optional<YLimits> &y_limits) = 0;

	/// std::nullopt hides the colorbar.
	virtual void setColorbar(const std::optional<color::ColorRange> &range, const std::string &label) = 0;

	virtual void setLabels(const ChartLabels &labels) = 0;
};

} // namespace eventstack::chart
