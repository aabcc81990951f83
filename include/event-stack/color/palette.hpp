#pragma once

#include <Eigen/Dense>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace eventstack::color {

struct Rgb {
	double r = 0.0;
	double g = 0.0;
	double b = 0.0;

	friend bool operator==(const Rgb &lhs, const Rgb &rhs) {
		return lhs.r == rhs.r && lhs.g == rhs.g && lhs.b == rhs.b;
	}

	friend bool operator!=(const Rgb &lhs, const Rgb &rhs) {
		return !(lhs == rhs);
	}
};

enum class ColorMode {
	Colormapped,
	Solid
};

/// Parses "colormapped" or "solid" (case-insensitive); throws ChartInputError otherwise.
ColorMode parseColorMode(std::string_view text);

std::string toString(ColorMode mode);

/**
 * @class Palette
 * @brief An ordered, non-empty table of RGB colors, one per row.
 */
class Palette {
public:
	using Matrix = Eigen::Matrix<double, Eigen::Dynamic, 3>;

	/// The default 64-entry blue-to-yellow palette.
	Palette();

	/**
	 * @throws ChartInputError If @p colors is empty or a channel lies outside [0, 1].
	 */
	explicit Palette(Matrix colors);

	static Palette fromColors(const std::vector<Rgb> &colors);

	/// Linear interpolation from @p first to @p last over @p count entries.
	static Palette gradient(const Rgb &first, const Rgb &last, std::size_t count);

	std::size_t size() const {
		return static_cast<std::size_t>(colors_.rows());
	}

	Rgb at(std::size_t index) const;

	const Matrix &matrix() const {
		return colors_;
	}

private:
	Matrix colors_;
};

} // namespace eventstack::color
