#include "event-stack/chart/chart_builder.hpp"
#include "event-stack/chart/renderer.hpp"
#include "event-stack/utils/calendar.hpp"
#include "event-stack/utils/logging.hpp"
#include <chrono>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace eventstack;

namespace {

std::string formatTime(const core::TimePoint &tp, core::TimePeriod period) {
	const auto civil = utils::toCivil(tp);
	std::ostringstream out;
	out << std::setfill('0');
	if (period == core::TimePeriod::Day) {
		out << std::setw(2) << civil.hour << ":" << std::setw(2) << civil.minute;
	} else {
		out << std::setw(2) << civil.day << "." << std::setw(2) << civil.month << ".";
	}
	return out.str();
}

/// Prints each frame to stdout instead of drawing it.
class ConsoleRenderer : public chart::IChartRenderer {
public:
	explicit ConsoleRenderer(core::TimePeriod period) : period_(period) {
	}

	void setPeriod(core::TimePeriod period) {
		period_ = period;
	}

	void drawPolylines(const std::vector<geometry::RenderSegment> &segments) override {
		std::cout << "  " << segments.size() << " polylines\n";
		for (const auto &segment : segments) {
			std::cout << "    " << std::setw(14) << std::left << segment.label << std::right << " "
			          << formatTime(segment.x[1], period_) << " - " << formatTime(segment.x[3], period_)
			          << "  y=" << std::fixed << std::setprecision(2) << segment.y[1].value_or(0.0)
			          << (segment.wraps() ? "  (wraps)" : "") << "\n";
			std::cout.unsetf(std::ios::floatfield);
		}
	}

	void setLineColors(const std::vector<color::Rgb> &colors) override {
		std::cout << "  colors:";
		for (const auto &color : colors) {
			std::cout << " (" << std::fixed << std::setprecision(2) << color.r << ", " << color.g << ", " << color.b
			          << ")";
		}
		std::cout << "\n";
		std::cout.unsetf(std::ios::floatfield);
	}

	void setLineStyle(const chart::LineStyle &style) override {
		std::cout << "  style: marker " << chart::toString(style.marker) << ", width " << style.line_width
		          << ", marker size " << style.marker_size.value_or(0.0) << "\n";
	}

	void setTickLabelFormat(const std::string &format) override {
		std::cout << "  ticks: " << format << "\n";
	}

	void setValueDisplayFormat(const std::string &format) override {
		std::cout << "  data tips: " << format << "\n";
	}

	void setLimits(const std::optional<chart::XLimits> &, const std::optional<chart::YLimits> &y) override {
		if (y) {
			std::cout << "  y limits: [" << y->lower << ", " << y->upper << "]\n";
		}
	}

	void setColorbar(const std::optional<color::ColorRange> &range, const std::string &label) override {
		if (range) {
			std::cout << "  colorbar '" << label << "': [" << range->min << ", " << range->max << "]\n";
		} else {
			std::cout << "  colorbar hidden\n";
		}
	}

	void setLabels(const chart::ChartLabels &labels) override {
		std::cout << "  title: " << labels.title << "\n";
	}

private:
	core::TimePeriod period_;
};

void printHeader(const std::string &title) {
	std::cout << "\n=== " << title << " ===\n\n";
}

core::Timestamp at(int year, int month, int day, int hour = 0, int minute = 0) {
	return core::Timestamp::fromCivil(year, month, day, hour, minute);
}

} // namespace

int main() {
	utils::Logging::init();

	std::cout << "=== Event Stack Chart Examples ===\n";

	// ===================================================================
	// Scenario 1: Shifts over a week, stacked on one day
	// ===================================================================
	printHeader("Scenario 1: Shifts on a daily cycle");

	chart::ChartLabels shift_labels;
	shift_labels.title = "Shifts";
	shift_labels.colorbar_label = "Hours";

	auto shifts = chart::ChartDataEngineBuilder()
	                  .withStartTimes({at(2024, 3, 4, 6), at(2024, 3, 5, 14), at(2024, 3, 6, 22), at(2024, 3, 8, 9)})
	                  .withEndTimes({at(2024, 3, 4, 14), at(2024, 3, 5, 22), at(2024, 3, 7, 6), at(2024, 3, 8, 12)})
	                  .withEventNames({"early", "late", "night", "standby"})
	                  .withLabels(shift_labels)
	                  .build();

	ConsoleRenderer renderer(core::TimePeriod::Day);
	shifts->render(renderer);

	std::cout << "\nSame shifts with a solid color and circle markers:\n";
	shifts->setColorMode(color::ColorMode::Solid);
	shifts->setMarker("o");
	shifts->render(renderer);

	// ===================================================================
	// Scenario 2: Holidays over two years, stacked on one year
	// ===================================================================
	printHeader("Scenario 2: Holidays on a yearly cycle");

	auto holidays = chart::ChartDataEngineBuilder()
	                    .withStartTimes({at(2023, 12, 22), at(2024, 7, 15), at(2025, 4, 14)})
	                    .withDurations({std::chrono::hours(24 * 14), std::chrono::hours(24 * 21),
	                                    std::chrono::hours(24 * 5)})
	                    .withEventNames({"winter", "summer", "easter"})
	                    .build();

	renderer.setPeriod(core::TimePeriod::Year);
	holidays->render(renderer);

	// ===================================================================
	// Scenario 3: Forcing a period that is too short
	// ===================================================================
	printHeader("Scenario 3: Period too narrow");

	const auto longest = holidays->event(1);
	std::cout << "  '" << longest.name << "' lasts "
	          << std::chrono::duration_cast<std::chrono::hours>(longest.duration()).count() << " hours\n";

	holidays->setPeriod(core::TimePeriod::Day);
	if (const auto issue = holidays->recompute()) {
		std::cout << "  " << core::toString(issue->kind) << ": " << issue->message << "\n";
	}
	std::cout << "  Previous frame kept (generation " << holidays->generation() << ")\n";

	return 0;
}
