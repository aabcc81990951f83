#include "event-stack/color/color_mapper.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace eventstack::color {

namespace {

constexpr double kUpperSlotOffset = 0.99;

} // namespace

ColorRange colorDomain(const std::vector<double> &values) {
	if (values.empty()) {
		throw std::invalid_argument("Color domain requires at least one value.");
	}
	const auto [min_it, max_it] = std::minmax_element(values.begin(), values.end());
	ColorRange range{*min_it, *max_it};
	if (range.min == range.max) {
		range.max = range.min + 1.0;
	}
	return range;
}

std::size_t paletteIndex(double value, const ColorRange &range, std::size_t palette_size) {
	if (palette_size == 0) {
		throw std::invalid_argument("Palette must contain at least one color.");
	}
	const double upper = static_cast<double>(palette_size) + kUpperSlotOffset;
	const double scaled = 1.0 + (value - range.min) / (range.max - range.min) * (upper - 1.0);
	const double slot = std::clamp(std::floor(scaled), 1.0, static_cast<double>(palette_size));
	return static_cast<std::size_t>(slot) - 1;
}

ColorAssignment mapColors(const std::vector<double> &values, const Palette &palette, ColorMode mode) {
	ColorAssignment assignment;
	if (mode == ColorMode::Solid) {
		assignment.colors.assign(values.size(), palette.at(0));
		return assignment;
	}
	if (values.empty()) {
		return assignment;
	}

	const auto range = colorDomain(values);
	assignment.colors.reserve(values.size());
	assignment.palette_indices.reserve(values.size());
	for (const double value : values) {
		const auto index = paletteIndex(value, range, palette.size());
		assignment.palette_indices.push_back(index);
		assignment.colors.push_back(palette.at(index));
	}
	assignment.range = range;
	return assignment;
}

} // namespace eventstack::color
