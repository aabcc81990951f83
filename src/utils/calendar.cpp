#include "event-stack/utils/calendar.hpp"

#include <ctime>
#include <stdexcept>

namespace eventstack::utils {

namespace {

bool safeGmTime(std::time_t time_value, std::tm &out) {
#if defined(_WIN32)
	return gmtime_s(&out, &time_value) == 0;
#else
	return gmtime_r(&time_value, &out) != nullptr;
#endif
}

std::time_t safeTimeGm(std::tm &tm) {
#if defined(_WIN32)
	return _mkgmtime(&tm);
#else
	return timegm(&tm);
#endif
}

} // namespace

CivilTime toCivil(const TimePoint &tp) {
	const auto whole_seconds = std::chrono::floor<std::chrono::seconds>(tp);
	std::tm tm{};
	if (!safeGmTime(static_cast<std::time_t>(whole_seconds.time_since_epoch().count()), tm)) {
		throw std::out_of_range("Time point cannot be represented as a calendar date.");
	}

	CivilTime civil;
	civil.year = tm.tm_year + 1900;
	civil.month = tm.tm_mon + 1;
	civil.day = tm.tm_mday;
	civil.hour = tm.tm_hour;
	civil.minute = tm.tm_min;
	civil.second = tm.tm_sec;
	civil.subsecond = tp - whole_seconds;
	return civil;
}

TimePoint fromCivil(const CivilTime &civil) {
	std::tm tm{};
	tm.tm_year = civil.year - 1900;
	tm.tm_mon = civil.month - 1;
	tm.tm_mday = civil.day;
	tm.tm_hour = civil.hour;
	tm.tm_min = civil.minute;
	tm.tm_sec = civil.second;
	tm.tm_isdst = 0;

	const std::time_t seconds = safeTimeGm(tm);
	return TimePoint{std::chrono::duration_cast<TimePoint::duration>(std::chrono::seconds{seconds})} +
	       civil.subsecond;
}

TimePoint makeTimePoint(int year, int month, int day, int hour, int minute, int second) {
	CivilTime civil;
	civil.year = year;
	civil.month = month;
	civil.day = day;
	civil.hour = hour;
	civil.minute = minute;
	civil.second = second;
	return fromCivil(civil);
}

} // namespace eventstack::utils
