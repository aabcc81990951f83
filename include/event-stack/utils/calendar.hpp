#pragma once

#include <chrono>

namespace eventstack::utils {

using TimePoint = std::chrono::system_clock::time_point;

/**
 * @struct CivilTime
 * @brief Broken-down proleptic Gregorian fields of a wall-clock time point.
 *
 * Month and day are one-based. The sub-second remainder is kept separately so
 * composing a CivilTime back into a TimePoint is lossless.
 */
struct CivilTime {
	int year = 1970;
	int month = 1;
	int day = 1;
	int hour = 0;
	int minute = 0;
	int second = 0;
	TimePoint::duration subsecond{0};
};

/// Splits a time point into civil fields, treating it as UTC.
CivilTime toCivil(const TimePoint &tp);

/**
 * @brief Composes civil fields into a time point, treating them as UTC.
 *
 * Out-of-range fields roll over the way std::timegm does, so 29 February of a
 * non-leap year yields 1 March.
 */
TimePoint fromCivil(const CivilTime &civil);

TimePoint makeTimePoint(int year, int month, int day, int hour = 0, int minute = 0, int second = 0);

} // namespace eventstack::utils
