#include "event-stack/core/timestamp.hpp"

#include "event-stack/core/chart_issue.hpp"
#include "event-stack/utils/calendar.hpp"

#include <utility>

namespace eventstack::core {

namespace {

void validateZone(const TimeZoneInfo &zone) {
	if (zone.name.empty()) {
		throw ChartInputError(IssueKind::InvalidInput, "Timezone name must not be empty.");
	}
	if (zone.utc_offset) {
		const auto offset = zone.utc_offset->count();
		if (offset < -24 * 60 || offset > 24 * 60) {
			throw ChartInputError(IssueKind::InvalidInput, "Timezone UTC offset must be within [-24h, 24h].");
		}
	}
}

} // namespace

Timestamp::Timestamp(TimePoint wall, TimeZoneInfo zone) : wall_(wall) {
	validateZone(zone);
	zone_ = std::move(zone);
}

Timestamp Timestamp::fromCivil(int year, int month, int day, int hour, int minute, int second) {
	return Timestamp(utils::makeTimePoint(year, month, day, hour, minute, second));
}

TimePoint Timestamp::instant() const {
	if (zone_ && zone_->utc_offset) {
		return wall_ - *zone_->utc_offset;
	}
	return wall_;
}

Timestamp Timestamp::operator+(Duration delta) const {
	Timestamp shifted(*this);
	shifted.wall_ += delta;
	return shifted;
}

} // namespace eventstack::core
