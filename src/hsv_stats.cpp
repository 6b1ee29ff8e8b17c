#include "hsv_stats.hpp"
#include "diagnostics.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

// Wrap a half-scale hue into [0, 180)
static double wrapHue(double hue)
{
	double h = std::fmod(hue, 180.0);
	if (h < 0.0) h += 180.0;
	if (h >= 180.0) h -= 180.0;
	return h;
}

double circularMeanHue(const std::vector<double>& hues, const std::vector<double>& weights)
{
	if (hues.size() != weights.size()) throw std::invalid_argument("circularMeanHue: hues and weights differ in size");
	if (hues.empty()) return 0.0;

	bool identical = true;
	for (size_t i = 1; i < hues.size() && identical; ++i) identical = hues[i] == hues[0];

	double sumW = 0.0, sumCos = 0.0, sumSin = 0.0;
	for (size_t i = 0; i < hues.size(); ++i) {
		double angle = hues[i] * CV_PI / 90.0; // half-scale hue to radians on the full circle
		sumW += weights[i];
		sumCos += weights[i] * std::cos(angle);
		sumSin += weights[i] * std::sin(angle);
	}
	if (sumW <= 0.0) return 0.0;
	if (identical) return wrapHue(hues[0]);

	// Opposite hues with equal weight have no mean direction
	if (std::hypot(sumCos, sumSin) < 1e-12 * sumW) return 0.0;

	return wrapHue(std::atan2(sumSin, sumCos) * 90.0 / CV_PI);
}

double hueDistance(double a, double b)
{
	double d = std::fmod(std::abs(a - b), 180.0);
	return std::min(d, 180.0 - d);
}

double hueDelta(double a, double b)
{
	double d = std::fmod(a - b, 180.0);
	if (d > 90.0) d -= 180.0;
	if (d <= -90.0) d += 180.0;
	return d;
}

bool hasHue(const cv::Vec3d& hsv, double min_saturation, double min_value)
{
	return hsv[1] >= min_saturation && hsv[2] >= min_value;
}

Palette chromaticEntries(const Palette& palette, double min_saturation, double min_value)
{
	Palette chromatic;
	for (const PaletteEntry& e : palette) {
		if (hasHue(e.hsv, min_saturation, min_value)) chromatic.push_back(e);
	}
	return chromatic;
}

HsvStatistics computeHsvStatistics(const Palette& palette, double min_saturation, double min_value)
{
	if (palette.empty()) throw EmptyPaletteError("computeHsvStatistics: palette has no entries");

	std::vector<double> hues, ratios;
	double totalRatio = 0.0, sat = 0.0, val = 0.0;
	for (const PaletteEntry& e : palette) {
		if (hasHue(e.hsv, min_saturation, min_value)) {
			hues.push_back(e.hsv[0]);
			ratios.push_back(e.ratio);
		}
		totalRatio += e.ratio;
		sat += e.ratio * e.hsv[1];
		val += e.ratio * e.hsv[2];
	}

	HsvStatistics stats;
	stats.dominant = palette[0].hsv;
	stats.dominant_ratio = palette[0].ratio;
	stats.mean = cv::Vec3d(
		circularMeanHue(hues, ratios),
		totalRatio > 0.0 ? sat / totalRatio : 0.0,
		totalRatio > 0.0 ? val / totalRatio : 0.0);
	return stats;
}
