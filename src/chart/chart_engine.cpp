#include "event-stack/chart/chart_engine.hpp"

#include "event-stack/period/period_selector.hpp"
#include "event-stack/utils/logging.hpp"
#include "event-stack/validation/interval_validator.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <string>
#include <utility>

namespace eventstack::chart {

namespace {

using Hours = std::chrono::duration<double, std::ratio<3600>>;
using Days = std::chrono::duration<double, std::ratio<86400>>;

void requireFinite(const std::vector<double> &values, const char *what) {
	if (std::any_of(values.begin(), values.end(), [](double v) { return !std::isfinite(v); })) {
		throw core::ChartInputError(core::IssueKind::InvalidInput, std::string(what) + " values must be finite.");
	}
}

std::vector<double> durationsAsValues(const std::vector<core::Duration> &durations, core::TimePeriod period) {
	std::vector<double> values;
	values.reserve(durations.size());
	for (const auto &duration : durations) {
		values.push_back(period == core::TimePeriod::Day ? Hours(duration).count() : Days(duration).count());
	}
	return values;
}

} // namespace

ChartDataEngine::ChartDataEngine(core::EngineConfig config) : config_(std::move(config)) {
	config_.validate();
	style_.marker_size = config_.marker_size;
}

ChartDataEngine::ChartDataEngine(core::EventSet events, core::EngineConfig config)
    : ChartDataEngine(std::move(config)) {
	setEvents(std::move(events));
}

void ChartDataEngine::setStartTimes(std::vector<core::Timestamp> starts) {
	inputs_.starts = std::move(starts);
	markDirty();
}

void ChartDataEngine::setEndTimes(std::vector<core::Timestamp> ends) {
	inputs_.ends = std::move(ends);
	markDirty();
}

void ChartDataEngine::setEvents(core::EventSet events) {
	requireFinite(events.y_values, "Y");
	requireFinite(events.color_values, "Color");
	inputs_.starts = std::move(events.starts);
	inputs_.ends = std::move(events.ends);
	inputs_.names = std::move(events.names);
	if (!events.y_values.empty()) {
		inputs_.y_values = std::move(events.y_values);
	}
	if (!events.color_values.empty()) {
		inputs_.color_values = std::move(events.color_values);
	}
	markDirty();
}

void ChartDataEngine::setEventNames(std::vector<std::string> names) {
	inputs_.names = std::move(names);
	markDirty();
}

void ChartDataEngine::setYValues(std::vector<double> values) {
	requireFinite(values, "Y");
	inputs_.y_values = std::move(values);
	markDirty();
}

void ChartDataEngine::setColorValues(std::vector<double> values) {
	requireFinite(values, "Color");
	inputs_.color_values = std::move(values);
	markColorsStale();
}

void ChartDataEngine::setPeriod(std::optional<core::TimePeriod> period) {
	fixed_period_ = period;
	markDirty();
}

void ChartDataEngine::setPeriod(std::string_view period) {
	setPeriod(std::optional<core::TimePeriod>(core::parseTimePeriod(period)));
}

void ChartDataEngine::setPalette(color::Palette palette) {
	palette_ = std::move(palette);
	color_mode_ = color::ColorMode::Colormapped;
	markColorsStale();
}

void ChartDataEngine::setColorMode(color::ColorMode mode) {
	color_mode_ = mode;
	markColorsStale();
}

void ChartDataEngine::setColorMode(std::string_view mode) {
	setColorMode(color::parseColorMode(mode));
}

void ChartDataEngine::setLineStyle(LineStyle style) {
	style.validate();
	if (!style.marker_size) {
		style.marker_size = config_.marker_size;
	}
	style_ = style;
}

void ChartDataEngine::setMarker(std::string_view symbol) {
	style_.marker = parseMarker(symbol);
}

void ChartDataEngine::setLabels(ChartLabels labels) {
	labels_ = std::move(labels);
}

void ChartDataEngine::setXLimits(const XLimits &limits) {
	x_limits_ = XLimits::make(limits.lower, limits.upper);
}

void ChartDataEngine::setYLimits(const YLimits &limits) {
	y_limits_ = YLimits::make(limits.lower, limits.upper);
}

void ChartDataEngine::resetXLimits() {
	x_limits_.reset();
}

void ChartDataEngine::resetYLimits() {
	y_limits_.reset();
}

const std::vector<double> &ChartDataEngine::yValues() {
	if (yValueMode() == core::DerivedMode::Manual) {
		return inputs_.y_values;
	}
	if (dirty_) {
		recompute();
	}
	return derived_.y_values;
}

const std::vector<double> &ChartDataEngine::colorValues() {
	if (colorValueMode() == core::DerivedMode::Manual) {
		return inputs_.color_values;
	}
	if (isDirty()) {
		recompute();
	}
	return derived_.color_values;
}

std::optional<core::TimePeriod> ChartDataEngine::period() {
	if (fixed_period_) {
		return fixed_period_;
	}
	if (dirty_) {
		recompute();
	}
	return derived_.period;
}

std::string ChartDataEngine::tickLabelFormat() const {
	return derived_.period ? core::tickLabelFormat(*derived_.period) : std::string();
}

std::string ChartDataEngine::valueDisplayFormat() const {
	return derived_.period ? core::displayFormat(*derived_.period) : std::string();
}

std::optional<core::ChartIssue> ChartDataEngine::recompute() {
	if (!isDirty()) {
		return std::nullopt;
	}
	if (pending_issue_) {
		// Inputs are unchanged since the last failed pass.
		return pending_issue_;
	}
	return dirty_ ? rebuild() : remapColors();
}

std::optional<core::ChartIssue> ChartDataEngine::rebuild() {
	if (auto issue = validation::validateIntervals(inputs_)) {
		return fail(std::move(*issue));
	}

	DerivedState next;
	next.durations = inputs_.durations();

	const auto chosen = period::selectPeriod(next.durations, fixed_period_, config_);
	if (auto issue = period::checkPeriodCapacity(next.durations, chosen, config_)) {
		return fail(std::move(*issue));
	}
	next.period = chosen;

	next.y_values = inputs_.y_values.empty() ? durationsAsValues(next.durations, chosen) : inputs_.y_values;
	next.color_values = inputs_.color_values.empty() ? next.y_values : inputs_.color_values;

	next.window = normalize::makeCycleWindow(inputs_.starts, chosen);
	if (next.window) {
		const int reference_year = next.window->year();
		const auto starts = normalize::normalizeTimes(inputs_.starts, reference_year, chosen);
		const auto ends = normalize::normalizeTimes(inputs_.ends, reference_year, chosen);
		if ((starts.zone_discarded || ends.zone_discarded) && !time_zone_advised_) {
			time_zone_advised_ = true;
			advise(core::ChartIssue::make(core::IssueKind::TimeZoneIgnored, "TimeZone is being ignored."));
		}
		next.segments = geometry::generateSegments(starts.values, ends.values, next.durations, next.y_values,
		                                           *next.window, inputs_.names);
	}

	next.colors = color::mapColors(next.color_values, palette_, color_mode_);
	next.generation = derived_.generation + 1;

	derived_ = std::move(next);
	dirty_ = false;
	colors_stale_ = false;
	EVENTSTACK_DEBUG("Recomputed {} events on a {} period (generation {}).", derived_.segments.size(),
	                 core::toString(chosen), derived_.generation);
	return std::nullopt;
}

std::optional<core::ChartIssue> ChartDataEngine::remapColors() {
	if (auto issue = validation::validateIntervals(inputs_)) {
		return fail(std::move(*issue));
	}
	auto values = inputs_.color_values.empty() ? derived_.y_values : inputs_.color_values;
	auto colors = color::mapColors(values, palette_, color_mode_);

	derived_.color_values = std::move(values);
	derived_.colors = std::move(colors);
	colors_stale_ = false;
	EVENTSTACK_DEBUG("Remapped colors for {} events ({}).", derived_.colors.colors.size(),
	                 color::toString(color_mode_));
	return std::nullopt;
}

std::optional<core::ChartIssue> ChartDataEngine::fail(core::ChartIssue issue) {
	pending_issue_ = issue;
	advise(std::move(issue));
	return pending_issue_;
}

void ChartDataEngine::advise(core::ChartIssue issue) {
	EVENTSTACK_WARN("{}: {}", core::toString(issue.kind), issue.message);
	advisories_.push_back(std::move(issue));
}

void ChartDataEngine::markDirty() {
	dirty_ = true;
	pending_issue_.reset();
}

void ChartDataEngine::markColorsStale() {
	colors_stale_ = true;
	if (!dirty_) {
		// A geometry failure stays pending until a geometry input changes.
		pending_issue_.reset();
	}
}

void ChartDataEngine::render(IChartRenderer &renderer) {
	// A failed pass is already recorded as an advisory; the last valid frame is pushed.
	recompute();

	renderer.setLabels(labels_);
	if (derived_.generation != rendered_generation_) {
		renderer.drawPolylines(derived_.segments);
		if (derived_.period) {
			renderer.setTickLabelFormat(core::tickLabelFormat(*derived_.period));
			renderer.setValueDisplayFormat(core::displayFormat(*derived_.period));
		}
		rendered_generation_ = derived_.generation;
	}
	renderer.setLineColors(derived_.colors.colors);
	renderer.setColorbar(derived_.colors.range, labels_.colorbar_label);
	renderer.setLineStyle(style_);
	renderer.setLimits(x_limits_, y_limits_);
}

ChartState ChartDataEngine::saveState() const {
	ChartState state;
	if (yValueMode() == core::DerivedMode::Manual) {
		state.y_values = inputs_.y_values;
	}
	if (colorValueMode() == core::DerivedMode::Manual) {
		state.color_values = inputs_.color_values;
	}
	state.period = fixed_period_;
	state.x_limits = x_limits_;
	state.y_limits = y_limits_;
	return state;
}

void ChartDataEngine::loadState(const ChartState &state) {
	if (state.x_limits) {
		setXLimits(*state.x_limits);
	}
	if (state.y_limits) {
		setYLimits(*state.y_limits);
	}
	if (state.y_values) {
		setYValues(*state.y_values);
	}
	if (state.color_values) {
		setColorValues(*state.color_values);
	}
	if (state.period) {
		setPeriod(state.period);
	}
}

} // namespace eventstack::chart
