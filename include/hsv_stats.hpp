#pragma once
#include <opencv2/core.hpp>
#include <vector>
#include "palette.hpp"

// Statistics of a palette shown to the user and folded into the feature vector
// - `dominant`: HSV color of the highest-ratio entry
// - `mean`: ratio-weighted mean color (circular mean for the hue)
// - `dominant_ratio`: area share of the dominant entry
struct HsvStatistics {
	cv::Vec3d dominant;
	cv::Vec3d mean;
	double dominant_ratio = 0.0;
};

// Weighted circular mean of hues in the half-scale domain [0, 180).
// Hues 2 and 177 average to 179.5, not 89.5. Identical inputs return that hue exactly.
// Returns 0 when the weights sum to zero or the hues cancel out.
double circularMeanHue(const std::vector<double>& hues, const std::vector<double>& weights);

// Unsigned circular distance between two half-scale hues, in [0, 90]
double hueDistance(double a, double b);

// Signed circular difference a - b of two half-scale hues, in (-90, 90]
double hueDelta(double a, double b);

// True if the color carries a usable hue. OpenCV reports H = 0 for whites, greys and blacks,
// so colors below either threshold are treated as having no hue at all.
bool hasHue(const cv::Vec3d& hsv, double min_saturation, double min_value);

// Entries of a palette that carry a hue (see hasHue), ratios left as they are
Palette chromaticEntries(const Palette& palette, double min_saturation, double min_value);

// Compute the statistics of a palette.
// The mean hue only averages entries that carry a hue; it is 0 when none does. Saturation, value and
// ratios use every entry.
//
// Args:
//   palette: the palette
//   min_saturation, min_value: achromatic thresholds (see hasHue); 0 treats every entry as chromatic
//
// Throws:
//   EmptyPaletteError if the palette has no entries
HsvStatistics computeHsvStatistics(const Palette& palette, double min_saturation = 0.0, double min_value = 0.0);
