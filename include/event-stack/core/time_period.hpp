#pragma once

#include <string>
#include <string_view>

namespace eventstack::core {

/// The cyclic reference interval events are projected onto.
enum class TimePeriod {
	Day,
	Year
};

/// Per-field flag telling the engine whether it computes a value or trusts the caller.
enum class DerivedMode {
	Auto,
	Manual
};

/**
 * @brief Parses "day" or "year" (case-insensitive).
 * @throws ChartInputError for any other text.
 */
TimePeriod parseTimePeriod(std::string_view text);

std::string toString(TimePeriod period);

/// Axis tick-label convention for the period ("HH:mm" or "MMM").
std::string tickLabelFormat(TimePeriod period);

/// Display convention for normalized values ("h:mm a" or "dd MM, yyyy").
std::string displayFormat(TimePeriod period);

} // namespace eventstack::core
