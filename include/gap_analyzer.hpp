#pragma once
#include <string>
#include <vector>
#include "feature_vector.hpp"

// One compared field
// - `delta`: evaluated - reference (signed circular difference for hue fields).
//   Positive means the image exceeds the style's typical value, negative means it falls short.
struct GapEntry {
	FeatureField field;
	std::string name;
	double evaluated;
	double reference;
	double delta;
};

// Entries sorted by descending |delta|, plus the generated hints
struct GapReport {
	std::vector<GapEntry> entries;
	std::vector<std::string> suggestions;
	std::string summary;
};

// How far a delta is from the style, relative to the field's range
enum GapMagnitude { GAP_NEGLIGIBLE = 0, GAP_SLIGHT = 1, GAP_MODERATE = 2, GAP_STRONG = 3 };

// Per-field mean of the style's positive vectors (circular mean for hue fields)
//
// Throws:
//   std::invalid_argument if `positives` is empty
FeatureVector referenceVector(const std::vector<FeatureVector>& positives);

// Bucket a delta of the given field (scores and ratio span 1, hues 90, saturation/value 255)
GapMagnitude gapMagnitude(FeatureField field, double delta);

// Color name of a half-scale hue ("red", "orange", "yellow", "green", "cyan", "blue", "purple", "magenta")
const char* hueName(double hue);

// Hint for one gap entry, empty when the delta is negligible.
// Deterministic in (field, sign of delta, magnitude bucket) and the reference hue for hue fields.
std::string suggestionFor(const GapEntry& entry);

// Compare an image against a style
//
// Args:
//   evaluated: feature vector of the evaluated image
//   positives: feature vectors of the style's positive images
//   suggestion_count: how many of the largest deltas are turned into hints
//
// Returns:
//   The GapReport
//
// Throws:
//   std::invalid_argument if `positives` is empty
GapReport analyzeGap(const FeatureVector& evaluated, const std::vector<FeatureVector>& positives, int suggestion_count = 3);
