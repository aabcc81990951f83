#include "event-stack/core/event_set.hpp"

#include "event-stack/core/chart_issue.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace eventstack::core {

namespace {

void requireNames(const std::vector<std::string> &names, std::size_t count) {
	if (!names.empty() && names.size() != count) {
		throw ChartInputError(IssueKind::NameSizeMismatch,
		                      "Event names must have the same number of elements as start times.");
	}
}

} // namespace

EventSet EventSet::fromEndTimes(std::vector<Timestamp> starts, std::vector<Timestamp> ends,
                                std::vector<std::string> names) {
	if (starts.size() != ends.size()) {
		throw ChartInputError(IssueKind::SizeMismatch, "Both data inputs must be vectors of the same length.");
	}
	requireNames(names, starts.size());

	EventSet set;
	set.starts = std::move(starts);
	set.ends = std::move(ends);
	set.names = std::move(names);

	const auto durations = set.durations();
	if (std::any_of(durations.begin(), durations.end(), [](const Duration &d) { return d < Duration::zero(); })) {
		throw ChartInputError(IssueKind::NegativeDuration, "Events cannot have negative durations.");
	}
	return set;
}

EventSet EventSet::fromDurations(std::vector<Timestamp> starts, const std::vector<Duration> &durations,
                                 std::vector<std::string> names) {
	if (starts.size() != durations.size()) {
		throw ChartInputError(IssueKind::SizeMismatch, "Both data inputs must be vectors of the same length.");
	}
	std::vector<Timestamp> ends;
	ends.reserve(starts.size());
	for (std::size_t i = 0; i < starts.size(); ++i) {
		ends.push_back(starts[i] + durations[i]);
	}
	return fromEndTimes(std::move(starts), std::move(ends), std::move(names));
}

Event EventSet::at(std::size_t index) const {
	if (index >= starts.size() || index >= ends.size()) {
		throw std::out_of_range("Requested event exceeds the event count.");
	}
	Event event{starts[index], ends[index], {}};
	if (index < names.size()) {
		event.name = names[index];
	}
	return event;
}

std::vector<Duration> EventSet::durations() const {
	if (starts.size() != ends.size()) {
		throw std::logic_error("Durations require matching start and end counts.");
	}
	std::vector<Duration> result;
	result.reserve(starts.size());
	for (std::size_t i = 0; i < starts.size(); ++i) {
		result.push_back(ends[i] - starts[i]);
	}
	return result;
}

} // namespace eventstack::core
