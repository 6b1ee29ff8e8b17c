#include "gap_analyzer.hpp"
#include "hsv_stats.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

// Hint texts per field: what to do when the image falls short of the style, and when it overshoots.
// Hue fields are phrased from the reference hue instead (see suggestionFor).
struct FieldHints {
	const char* deficit;
	const char* excess;
};

static const FieldHints kHints[FEATURE_COUNT] = {
	{ "increase hue contrast toward complementary pairing (colors opposite on the wheel)",
	  "soften the complementary contrast; opposite hues are stronger than the style uses" },
	{ "bring in neighbouring hues for an analogous scheme",
	  "break up the run of neighbouring hues with a contrasting accent" },
	{ "unify the palette around one hue family using its tints and shades",
	  "add variety; the palette is more single-hued than the style" },
	{ "add two accents flanking the complement of the main color",
	  "tone down the split-complementary accents" },
	{ "balance three hues spaced evenly around the wheel",
	  "reduce the evenly spaced accent hues" },
	{ "overall harmony is below the style; work on the largest gaps first",
	  "overall harmony is above the style's typical level" },
	{ "", "" },
	{ "use a more saturated main color", "mute the main color" },
	{ "brighten the main color", "darken the main color" },
	{ "", "" },
	{ "raise overall saturation", "lower overall saturation" },
	{ "brighten the room overall with lighter surfaces or lighting", "add darker elements to deepen the room" },
	{ "let the main color cover more of the room", "break up the main color with secondary colors" },
};

// Range a delta of the field is measured against
static double fieldScale(FeatureField field)
{
	if (isHueField(field)) return 90.0; // largest circular hue difference
	switch (field) {
	case FEATURE_DOMINANT_S:
	case FEATURE_DOMINANT_V:
	case FEATURE_MEAN_S:
	case FEATURE_MEAN_V:
		return 255.0;
	default:
		return 1.0;
	}
}

FeatureVector referenceVector(const std::vector<FeatureVector>& positives)
{
	if (positives.empty()) throw std::invalid_argument("referenceVector: style has no positive examples");

	FeatureVector reference;
	for (int f = 0; f < FEATURE_COUNT; ++f) {
		if (isHueField((FeatureField)f)) {
			std::vector<double> hues;
			for (const FeatureVector& p : positives) hues.push_back(p[f]);
			reference[f] = circularMeanHue(hues, std::vector<double>(hues.size(), 1.0));
			continue;
		}
		// Running mean: identical inputs give back exactly that value
		double mean = 0.0;
		for (size_t i = 0; i < positives.size(); ++i) mean += (positives[i][f] - mean) / (double)(i + 1);
		reference[f] = mean;
	}
	return reference;
}

GapMagnitude gapMagnitude(FeatureField field, double delta)
{
	double normalized = std::abs(delta) / fieldScale(field);
	if (normalized < 0.05) return GAP_NEGLIGIBLE;
	if (normalized < 0.15) return GAP_SLIGHT;
	if (normalized < 0.35) return GAP_MODERATE;
	return GAP_STRONG;
}

const char* hueName(double hue)
{
	double deg = std::fmod(hue, 180.0) * 2.0;
	if (deg < 0.0) deg += 360.0;
	if (deg < 15.0 || deg >= 345.0) return "red";
	if (deg < 45.0) return "orange";
	if (deg < 70.0) return "yellow";
	if (deg < 160.0) return "green";
	if (deg < 200.0) return "cyan";
	if (deg < 260.0) return "blue";
	if (deg < 290.0) return "purple";
	return "magenta";
}

std::string suggestionFor(const GapEntry& entry)
{
	GapMagnitude magnitude = gapMagnitude(entry.field, entry.delta);
	if (magnitude == GAP_NEGLIGIBLE) return std::string();

	static const char* const kAdverbs[] = { "", "slightly", "noticeably", "far" };

	std::ostringstream out;
	out << entry.name << " is " << kAdverbs[magnitude];

	if (isHueField(entry.field)) {
		// The hue is rotated away from the style; say where to go rather than which way
		out << " off the style's hue: shift the "
			<< (entry.field == FEATURE_DOMINANT_H ? "main color" : "overall color cast")
			<< " toward " << hueName(entry.reference);
		return out.str();
	}

	const FieldHints& hints = kHints[entry.field];
	out << (entry.delta < 0.0 ? " below" : " above") << " the style: "
		<< (entry.delta < 0.0 ? hints.deficit : hints.excess);
	return out.str();
}

GapReport analyzeGap(const FeatureVector& evaluated, const std::vector<FeatureVector>& positives, int suggestion_count)
{
	FeatureVector reference = referenceVector(positives);

	GapReport report;
	for (int f = 0; f < FEATURE_COUNT; ++f) {
		FeatureField field = (FeatureField)f;
		GapEntry entry;
		entry.field = field;
		entry.name = featureFieldName(field);
		entry.evaluated = evaluated[f];
		entry.reference = reference[f];
		entry.delta = isHueField(field) ? hueDelta(evaluated[f], reference[f]) : evaluated[f] - reference[f];
		report.entries.push_back(entry);
	}

	// Stable: equal gaps stay in field order
	std::stable_sort(report.entries.begin(), report.entries.end(), [](const GapEntry& a, const GapEntry& b) {
		return std::abs(a.delta) > std::abs(b.delta);
	});

	int limit = std::min(std::max(0, suggestion_count), (int)report.entries.size());
	for (int i = 0; i < limit; ++i) {
		std::string hint = suggestionFor(report.entries[i]);
		if (!hint.empty()) report.suggestions.push_back(hint);
	}

	if (report.suggestions.empty()) {
		report.summary = "Color composition matches the style's typical profile.";
	}
	else {
		const GapEntry& top = report.entries.front();
		std::ostringstream out;
		out << report.suggestions.size() << " adjustment" << (report.suggestions.size() == 1 ? "" : "s")
			<< " suggested; largest gap: " << top.name << " (" << std::showpos << std::fixed << std::setprecision(2)
			<< top.delta << ").";
		report.summary = out.str();
	}
	return report;
}
