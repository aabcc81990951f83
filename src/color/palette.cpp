#include "event-stack/color/palette.hpp"

#include "event-stack/core/chart_issue.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace eventstack::color {

namespace {

constexpr std::size_t kDefaultPaletteSize = 64;
const Rgb kDefaultFirst{0.2422, 0.1504, 0.6603};
const Rgb kDefaultLast{0.9769, 0.9839, 0.0805};

void validateColors(const Palette::Matrix &colors) {
	if (colors.rows() == 0) {
		throw core::ChartInputError(core::IssueKind::InvalidInput, "Colormap must contain at least one color.");
	}
	if (!colors.allFinite() || colors.minCoeff() < 0.0 || colors.maxCoeff() > 1.0) {
		throw core::ChartInputError(core::IssueKind::InvalidInput, "Colormap values must be in the range [0, 1].");
	}
}

} // namespace

ColorMode parseColorMode(std::string_view text) {
	std::string value(text);
	std::transform(value.begin(), value.end(), value.begin(),
	               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	if (value == "colormapped") {
		return ColorMode::Colormapped;
	}
	if (value == "solid") {
		return ColorMode::Solid;
	}
	throw core::ChartInputError(core::IssueKind::InvalidInput,
	                            "ColorMethod must be \"colormapped\" or \"solid\", got \"" + std::string(text) + "\".");
}

std::string toString(ColorMode mode) {
	return mode == ColorMode::Colormapped ? "colormapped" : "solid";
}

Palette::Palette() : Palette(gradient(kDefaultFirst, kDefaultLast, kDefaultPaletteSize)) {
}

Palette::Palette(Matrix colors) : colors_(std::move(colors)) {
	validateColors(colors_);
}

Palette Palette::fromColors(const std::vector<Rgb> &colors) {
	Matrix matrix(static_cast<Eigen::Index>(colors.size()), 3);
	for (std::size_t i = 0; i < colors.size(); ++i) {
		const auto row = static_cast<Eigen::Index>(i);
		matrix(row, 0) = colors[i].r;
		matrix(row, 1) = colors[i].g;
		matrix(row, 2) = colors[i].b;
	}
	return Palette(std::move(matrix));
}

Palette Palette::gradient(const Rgb &first, const Rgb &last, std::size_t count) {
	if (count == 0) {
		throw core::ChartInputError(core::IssueKind::InvalidInput, "Gradient palette needs at least one entry.");
	}
	const Eigen::RowVector3d from(first.r, first.g, first.b);
	const Eigen::RowVector3d to(last.r, last.g, last.b);
	const auto rows = static_cast<Eigen::Index>(count);
	Eigen::VectorXd t = Eigen::VectorXd::Zero(rows);
	if (count > 1) {
		t = Eigen::VectorXd::LinSpaced(rows, 0.0, 1.0);
	}

	Matrix matrix(rows, 3);
	for (Eigen::Index i = 0; i < rows; ++i) {
		matrix.row(i) = from + t(i) * (to - from);
	}
	return Palette(std::move(matrix));
}

Rgb Palette::at(std::size_t index) const {
	if (index >= size()) {
		throw std::out_of_range("Palette index exceeds the number of colors.");
	}
	const auto row = static_cast<Eigen::Index>(index);
	return Rgb{colors_(row, 0), colors_(row, 1), colors_(row, 2)};
}

} // namespace eventstack::color
