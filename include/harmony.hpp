#pragma once
#include <opencv2/core.hpp>
#include "palette.hpp"

// The five harmony metrics, in feature-vector order
enum HarmonyMetric {
	HARMONY_COMPLEMENTARY = 0,
	HARMONY_ANALOGOUS = 1,
	HARMONY_MONOCHROMATIC = 2,
	HARMONY_SPLIT_COMPLEMENTARY = 3,
	HARMONY_TRIADIC = 4,
	HARMONY_METRIC_COUNT = 5
};

// One score in [0, 1] per HarmonyMetric, indexed by the enum
typedef cv::Vec<double, HARMONY_METRIC_COUNT> HarmonyScores;

// snake_case name of a metric ("complementary", "split_complementary", ...)
const char* harmonyMetricName(HarmonyMetric metric);

// Drop entries whose ratio is below `threshold` and renormalize the remaining ratios to sum to 1.
// The first (dominant) entry is always kept.
Palette significantEntries(const Palette& palette, double threshold);

// Individual metrics. Each one expects a palette whose ratios sum to 1 (see significantEntries) and
// aggregates its pairs or triples weighted by the product of their ratios. Hue distances are circular
// and measured in degrees.

// Pairs close to 180 degrees apart. 0 for fewer than two entries.
double complementaryScore(const Palette& palette);
// Pairs within 30 degrees of each other, decaying beyond. 0 for fewer than two entries.
double analogousScore(const Palette& palette);
// Small hue differences with a bounded saturation/value spread. 1 for a single entry.
// Hue pairs only use entries that carry a hue (see hasHue); the spread uses every entry.
double monochromaticScore(const Palette& palette, double min_saturation = 0.0, double min_value = 0.0);
// Triples made of a base hue and two hues 150 degrees away from it on either side. 0 for fewer than three entries.
double splitComplementaryScore(const Palette& palette);
// Triples 120 degrees apart. 0 for fewer than three entries.
double triadicScore(const Palette& palette);

// Compute all five metrics of a palette, ignoring entries below `negligibility_threshold`.
// Whites, greys and blacks (below `min_saturation` or `min_value`) have no hue, so they never form
// hue pairs or triples; they still count in the monochromatic saturation/value spread.
//
// Throws:
//   EmptyPaletteError if the palette has no entries
HarmonyScores computeHarmonyScores(
	const Palette& palette,
	double negligibility_threshold,
	double min_saturation = 0.0,
	double min_value = 0.0
);
