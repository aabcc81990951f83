#pragma once

#include "event-stack/chart/chart_state.hpp"
#include "event-stack/chart/chart_types.hpp"
#include "event-stack/chart/renderer.hpp"
#include "event-stack/color/color_mapper.hpp"
#include "event-stack/color/palette.hpp"
#include "event-stack/core/chart_issue.hpp"
#include "event-stack/core/engine_config.hpp"
#include "event-stack/core/event_set.hpp"
#include "event-stack/core/time_period.hpp"
#include "event-stack/geometry/segment_generator.hpp"
#include "event-stack/normalize/cyclic_normalizer.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace eventstack::chart {

/**
 * @class ChartDataEngine
 * @brief Turns a set of intervals into render-ready polylines and colors.
 *
 * The engine holds the caller's inputs, a dirty flag and the last valid
 * derived state. Y values, color values and the period each run in auto mode
 * (derived from the events) or manual mode (supplied by the caller; assigning
 * an empty value switches back to auto).
 *
 * recompute() runs validation, period selection, normalization, segment
 * generation and color mapping. When any step fails the issue is returned
 * and recorded as an advisory, and the previous derived state stays in place.
 * A successful pass replaces the whole derived state at once.
 *
 * Not thread-safe.
 */
class ChartDataEngine {
public:
	explicit ChartDataEngine(core::EngineConfig config = {});

	explicit ChartDataEngine(core::EventSet events, core::EngineConfig config = {});

	// --- Inputs ---

	void setStartTimes(std::vector<core::Timestamp> starts);
	void setEndTimes(std::vector<core::Timestamp> ends);

	/// Replaces start and end times and names; non-empty overrides in @p events are applied too.
	void setEvents(core::EventSet events);

	void setEventNames(std::vector<std::string> names);

	/// Manual Y values; an empty vector reverts to auto. @throws ChartInputError on non-finite values.
	void setYValues(std::vector<double> values);

	/// Manual color values; an empty vector reverts to auto. @throws ChartInputError on non-finite values.
	void setColorValues(std::vector<double> values);

	/// Fixes the period; std::nullopt reverts to automatic selection.
	void setPeriod(std::optional<core::TimePeriod> period);
	void setPeriod(std::string_view period);

	/// Replaces the palette and switches the color mode to colormapped.
	void setPalette(color::Palette palette);
	void setColorMode(color::ColorMode mode);
	void setColorMode(std::string_view mode);

	/// A style without a marker size takes the configured one.
	void setLineStyle(LineStyle style);

	/// @throws ChartInputError For a symbol parseMarker does not know.
	void setMarker(std::string_view symbol);

	void setLabels(ChartLabels labels);

	void setXLimits(const XLimits &limits);
	void setYLimits(const YLimits &limits);
	void resetXLimits();
	void resetYLimits();

	// --- Accessors ---

	const std::vector<core::Timestamp> &startTimes() const {
		return inputs_.starts;
	}

	const std::vector<core::Timestamp> &endTimes() const {
		return inputs_.ends;
	}

	const std::vector<std::string> &eventNames() const {
		return inputs_.names;
	}

	/// @throws std::out_of_range If @p index is past the last event.
	core::Event event(std::size_t index) const {
		return inputs_.at(index);
	}

	/// Recomputes first when Y values are in auto mode and inputs changed.
	const std::vector<double> &yValues();

	/// Recomputes first when color values are in auto mode and inputs changed.
	const std::vector<double> &colorValues();

	/// Recomputes first when the period is in auto mode and inputs changed.
	std::optional<core::TimePeriod> period();

	/// Durations of the last valid event set.
	const std::vector<core::Duration> &eventDurations() const {
		return derived_.durations;
	}

	core::DerivedMode yValueMode() const {
		return inputs_.y_values.empty() ? core::DerivedMode::Auto : core::DerivedMode::Manual;
	}

	core::DerivedMode colorValueMode() const {
		return inputs_.color_values.empty() ? core::DerivedMode::Auto : core::DerivedMode::Manual;
	}

	core::DerivedMode periodMode() const {
		return fixed_period_ ? core::DerivedMode::Manual : core::DerivedMode::Auto;
	}

	const color::Palette &palette() const {
		return palette_;
	}

	color::ColorMode colorMode() const {
		return color_mode_;
	}

	const LineStyle &lineStyle() const {
		return style_;
	}

	const ChartLabels &labels() const {
		return labels_;
	}

	const std::optional<XLimits> &xLimits() const {
		return x_limits_;
	}

	const std::optional<YLimits> &yLimits() const {
		return y_limits_;
	}

	const core::EngineConfig &config() const {
		return config_;
	}

	bool isDirty() const {
		return dirty_ || colors_stale_;
	}

	// --- Derived output ---

	/**
	 * @brief Brings the derived state up to date with the inputs.
	 * @return The blocking issue, or std::nullopt when the state is current.
	 *
	 * A no-op when nothing changed since the last call.
	 */
	std::optional<core::ChartIssue> recompute();

	const std::vector<geometry::RenderSegment> &segments() const {
		return derived_.segments;
	}

	const color::ColorAssignment &colors() const {
		return derived_.colors;
	}

	const std::optional<normalize::CycleWindow> &cycleWindow() const {
		return derived_.window;
	}

	/// Tick-label convention of the last valid period, empty before the first successful pass.
	std::string tickLabelFormat() const;

	/// How normalized times read in data tips ("h:mm a" or "dd MM, yyyy"), empty before the first successful pass.
	std::string valueDisplayFormat() const;

	/// Counts successful geometry passes.
	std::uint64_t generation() const {
		return derived_.generation;
	}

	/// One host update: recompute if needed, then push the frame to @p renderer.
	void render(IChartRenderer &renderer);

	// --- Advisories ---

	const std::vector<core::ChartIssue> &advisories() const {
		return advisories_;
	}

	void clearAdvisories() {
		advisories_.clear();
	}

	bool timeZoneAdvisoryIssued() const {
		return time_zone_advised_;
	}

	// --- View state ---

	ChartState saveState() const;
	void loadState(const ChartState &state);

private:
	struct DerivedState {
		std::optional<core::TimePeriod> period;
		std::vector<core::Duration> durations;
		std::vector<double> y_values;
		std::vector<double> color_values;
		std::optional<normalize::CycleWindow> window;
		std::vector<geometry::RenderSegment> segments;
		color::ColorAssignment colors;
		std::uint64_t generation = 0;
	};

	void markDirty();
	void markColorsStale();
	std::optional<core::ChartIssue> rebuild();
	std::optional<core::ChartIssue> remapColors();
	std::optional<core::ChartIssue> fail(core::ChartIssue issue);
	void advise(core::ChartIssue issue);

	core::EngineConfig config_;
	core::EventSet inputs_;
	std::optional<core::TimePeriod> fixed_period_;
	color::Palette palette_;
	color::ColorMode color_mode_ = color::ColorMode::Colormapped;
	LineStyle style_;
	ChartLabels labels_;
	std::optional<XLimits> x_limits_;
	std::optional<YLimits> y_limits_;

	DerivedState derived_;
	bool dirty_ = false;
	bool colors_stale_ = false;
	std::optional<core::ChartIssue> pending_issue_;
	std::uint64_t rendered_generation_ = 0;

	std::vector<core::ChartIssue> advisories_;
	bool time_zone_advised_ = false;
};

} // namespace eventstack::chart
