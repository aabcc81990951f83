#include "event-stack/chart/chart_builder.hpp"

#include "event-stack/utils/logging.hpp"

#include <utility>

namespace eventstack::chart {

ChartDataEngineBuilder &ChartDataEngineBuilder::withStartTimes(std::vector<core::Timestamp> starts) {
	starts_ = std::move(starts);
	return *this;
}

ChartDataEngineBuilder &ChartDataEngineBuilder::withEndTimes(std::vector<core::Timestamp> ends) {
	ends_ = std::move(ends);
	return *this;
}

ChartDataEngineBuilder &ChartDataEngineBuilder::withDurations(std::vector<core::Duration> durations) {
	durations_ = std::move(durations);
	return *this;
}

ChartDataEngineBuilder &ChartDataEngineBuilder::withPeriod(core::TimePeriod period) {
	period_ = period;
	return *this;
}

ChartDataEngineBuilder &ChartDataEngineBuilder::withPeriod(std::string_view period) {
	period_ = core::parseTimePeriod(period);
	return *this;
}

ChartDataEngineBuilder &ChartDataEngineBuilder::withEventNames(std::vector<std::string> names) {
	names_ = std::move(names);
	return *this;
}

ChartDataEngineBuilder &ChartDataEngineBuilder::withYValues(std::vector<double> values) {
	y_values_ = std::move(values);
	return *this;
}

ChartDataEngineBuilder &ChartDataEngineBuilder::withColorValues(std::vector<double> values) {
	color_values_ = std::move(values);
	return *this;
}

ChartDataEngineBuilder &ChartDataEngineBuilder::withPalette(color::Palette palette) {
	palette_ = std::move(palette);
	return *this;
}

ChartDataEngineBuilder &ChartDataEngineBuilder::withColorMode(color::ColorMode mode) {
	color_mode_ = mode;
	return *this;
}

ChartDataEngineBuilder &ChartDataEngineBuilder::withLineStyle(LineStyle style) {
	style_ = style;
	return *this;
}

ChartDataEngineBuilder &ChartDataEngineBuilder::withLabels(ChartLabels labels) {
	labels_ = std::move(labels);
	return *this;
}

ChartDataEngineBuilder &ChartDataEngineBuilder::withConfig(core::EngineConfig config) {
	config_ = config;
	return *this;
}

std::unique_ptr<ChartDataEngine> ChartDataEngineBuilder::build() const {
	if (ends_ && durations_) {
		throw core::ChartInputError(core::IssueKind::InvalidInput,
		                            "Specify either end times or durations, not both.");
	}
	const bool has_second = ends_.has_value() || durations_.has_value();
	if (starts_.has_value() != has_second) {
		throw core::ChartInputError(core::IssueKind::InvalidInput,
		                            "Start times must be paired with end times or durations.");
	}

	auto engine = std::make_unique<ChartDataEngine>(config_);
	if (starts_) {
		auto events = ends_ ? core::EventSet::fromEndTimes(*starts_, *ends_, names_)
		                    : core::EventSet::fromDurations(*starts_, *durations_, names_);
		events.y_values = y_values_;
		events.color_values = color_values_;
		engine->setEvents(std::move(events));
	} else {
		if (!names_.empty()) {
			engine->setEventNames(names_);
		}
		if (!y_values_.empty()) {
			engine->setYValues(y_values_);
		}
		if (!color_values_.empty()) {
			engine->setColorValues(color_values_);
		}
	}

	if (period_) {
		engine->setPeriod(period_);
	}
	if (palette_) {
		engine->setPalette(*palette_);
	}
	if (color_mode_) {
		engine->setColorMode(*color_mode_);
	}
	if (style_) {
		engine->setLineStyle(*style_);
	}
	engine->setLabels(labels_);

	EVENTSTACK_DEBUG("Building chart engine with {} events.", engine->startTimes().size());
	return engine;
}

} // namespace eventstack::chart
