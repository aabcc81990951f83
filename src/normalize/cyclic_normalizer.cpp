#include "event-stack/normalize/cyclic_normalizer.hpp"

#include "event-stack/utils/calendar.hpp"

#include <algorithm>
#include <chrono>

namespace eventstack::normalize {

int CycleWindow::year() const {
	return utils::toCivil(start).year;
}

core::TimePoint normalizeTime(const core::Timestamp &timestamp, int reference_year, core::TimePeriod period) {
	auto civil = utils::toCivil(timestamp.wall());
	civil.year = reference_year;
	if (period == core::TimePeriod::Day) {
		civil.month = 1;
		civil.day = 1;
	}
	return utils::fromCivil(civil);
}

NormalizedTimes normalizeTimes(const std::vector<core::Timestamp> &timestamps, int reference_year,
                               core::TimePeriod period) {
	NormalizedTimes result;
	result.values.reserve(timestamps.size());
	for (const auto &timestamp : timestamps) {
		if (timestamp.hasZone()) {
			result.zone_discarded = true;
		}
		result.values.push_back(normalizeTime(timestamp, reference_year, period));
	}
	return result;
}

std::optional<CycleWindow> makeCycleWindow(const std::vector<core::Timestamp> &starts, core::TimePeriod period) {
	if (starts.empty()) {
		return std::nullopt;
	}
	const auto &earliest = *std::min_element(starts.begin(), starts.end());
	const int reference_year = utils::toCivil(earliest.wall()).year;

	auto civil = utils::toCivil(normalizeTime(earliest, reference_year, period));
	civil.hour = 0;
	civil.minute = 0;
	civil.second = 0;
	civil.subsecond = core::Duration::zero();

	CycleWindow window;
	if (period == core::TimePeriod::Day) {
		window.start = utils::fromCivil(civil);
		window.end = window.start + std::chrono::hours(24);
	} else {
		civil.month = 1;
		civil.day = 1;
		window.start = utils::fromCivil(civil);
		civil.year += 1;
		window.end = utils::fromCivil(civil);
	}
	return window;
}

} // namespace eventstack::normalize
