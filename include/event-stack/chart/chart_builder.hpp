#pragma once

#include "event-stack/chart/chart_engine.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace eventstack::chart {

/**
 * @class ChartDataEngineBuilder
 * @brief A builder for fluently configuring and creating ChartDataEngine instances.
 *
 * Events are given either as start and end times or as start times and
 * durations, never both.
 */
class ChartDataEngineBuilder {
public:
	ChartDataEngineBuilder &withStartTimes(std::vector<core::Timestamp> starts);
	ChartDataEngineBuilder &withEndTimes(std::vector<core::Timestamp> ends);
	ChartDataEngineBuilder &withDurations(std::vector<core::Duration> durations);

	ChartDataEngineBuilder &withPeriod(core::TimePeriod period);
	/// @throws ChartInputError Unless @p period is "day" or "year".
	ChartDataEngineBuilder &withPeriod(std::string_view period);

	ChartDataEngineBuilder &withEventNames(std::vector<std::string> names);
	ChartDataEngineBuilder &withYValues(std::vector<double> values);
	ChartDataEngineBuilder &withColorValues(std::vector<double> values);
	ChartDataEngineBuilder &withPalette(color::Palette palette);
	ChartDataEngineBuilder &withColorMode(color::ColorMode mode);
	ChartDataEngineBuilder &withLineStyle(LineStyle style);
	ChartDataEngineBuilder &withLabels(ChartLabels labels);
	ChartDataEngineBuilder &withConfig(core::EngineConfig config);

	/**
	 * @brief Creates the engine.
	 * @throws ChartInputError If end times and durations are both given, if
	 *         either is given without start times (or start times without
	 *         either), on length mismatch, or on a negative duration.
	 */
	std::unique_ptr<ChartDataEngine> build() const;

private:
	std::optional<std::vector<core::Timestamp>> starts_;
	std::optional<std::vector<core::Timestamp>> ends_;
	std::optional<std::vector<core::Duration>> durations_;
	std::optional<core::TimePeriod> period_;
	std::vector<std::string> names_;
	std::vector<double> y_values_;
	std::vector<double> color_values_;
	std::optional<color::Palette> palette_;
	std::optional<color::ColorMode> color_mode_;
	std::optional<LineStyle> style_;
	ChartLabels labels_;
	core::EngineConfig config_;
};

} // namespace eventstack::chart
