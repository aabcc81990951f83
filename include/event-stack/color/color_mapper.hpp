#pragma once

#include "event-stack/color/palette.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace eventstack::color {

/// Numeric domain mapped onto the palette; also the colorbar limits.
struct ColorRange {
	double min = 0.0;
	double max = 1.0;
};

struct ColorAssignment {
	std::vector<Rgb> colors;
	/// Zero-based palette rows, colormapped mode only.
	std::vector<std::size_t> palette_indices;
	/// Colorbar domain, colormapped mode with at least one value only.
	std::optional<ColorRange> range;
};

/**
 * @brief Min/max of @p values, widened to [min, min + 1] when all values are equal.
 * @throws std::invalid_argument For an empty input.
 */
ColorRange colorDomain(const std::vector<double> &values);

/**
 * @brief Palette row for @p value.
 *
 * The value is rescaled linearly from @p range into [1, size + 0.99],
 * floored and clipped to [1, size]; the result is returned zero-based.
 */
std::size_t paletteIndex(double value, const ColorRange &range, std::size_t palette_size);

ColorAssignment mapColors(const std::vector<double> &values, const Palette &palette, ColorMode mode);

} // namespace eventstack::color
