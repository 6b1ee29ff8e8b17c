#include "harmony.hpp"
#include "diagnostics.hpp"
#include "hsv_stats.hpp"
#include <algorithm>
#include <cmath>
#include <functional>

// Tolerances of the harmony rules, in degrees of the full hue circle
static const double kComplementarySigma = 30.0;
static const double kAnalogousWindow = 30.0;
static const double kAnalogousSigma = 20.0;
static const double kMonochromaticHueSigma = 15.0;
static const double kSplitComplementarySigma = 20.0;
static const double kTriadicSigma = 20.0;

// Saturation/value spread (fraction of the 0..255 range) a monochromatic palette may have before it is penalized
static const double kMonochromaticSpreadBound = 0.15;
static const double kMonochromaticSpreadSigma = 0.10;

static double gaussian(double x, double sigma)
{
	return std::exp(-(x * x) / (2.0 * sigma * sigma));
}

static double clamp01(double x)
{
	if (!std::isfinite(x)) return 0.0;
	return std::min(1.0, std::max(0.0, x));
}

// Circular distance of two palette hues in degrees, [0, 180]
static double degreesApart(const PaletteEntry& a, const PaletteEntry& b)
{
	return 2.0 * hueDistance(a.hsv[0], b.hsv[0]);
}

// Ratio-product weighted mean of `fit` over all pairs; 0 without pairs
static double pairAggregate(const Palette& palette, const std::function<double(double)>& fit)
{
	double num = 0.0, den = 0.0;
	for (size_t i = 0; i < palette.size(); ++i) {
		for (size_t j = i + 1; j < palette.size(); ++j) {
			double w = palette[i].ratio * palette[j].ratio;
			num += w * fit(degreesApart(palette[i], palette[j]));
			den += w;
		}
	}
	return den > 0.0 ? num / den : 0.0;
}

// Ratio-product weighted mean of `fit` over all triples; 0 without triples.
// `fit` receives the three pairwise distances d(a,b), d(a,c), d(b,c).
static double tripleAggregate(const Palette& palette, const std::function<double(double, double, double)>& fit)
{
	double num = 0.0, den = 0.0;
	for (size_t a = 0; a < palette.size(); ++a) {
		for (size_t b = a + 1; b < palette.size(); ++b) {
			for (size_t c = b + 1; c < palette.size(); ++c) {
				double w = palette[a].ratio * palette[b].ratio * palette[c].ratio;
				num += w * fit(degreesApart(palette[a], palette[b]),
					degreesApart(palette[a], palette[c]),
					degreesApart(palette[b], palette[c]));
				den += w;
			}
		}
	}
	return den > 0.0 ? num / den : 0.0;
}

const char* harmonyMetricName(HarmonyMetric metric)
{
	switch (metric) {
	case HARMONY_COMPLEMENTARY: return "complementary";
	case HARMONY_ANALOGOUS: return "analogous";
	case HARMONY_MONOCHROMATIC: return "monochromatic";
	case HARMONY_SPLIT_COMPLEMENTARY: return "split_complementary";
	case HARMONY_TRIADIC: return "triadic";
	default: return "unknown";
	}
}

Palette significantEntries(const Palette& palette, double threshold)
{
	Palette kept;
	double total = 0.0;
	for (size_t i = 0; i < palette.size(); ++i) {
		if (i > 0 && palette[i].ratio < threshold) continue;
		kept.push_back(palette[i]);
		total += palette[i].ratio;
	}
	if (total > 0.0) {
		for (PaletteEntry& e : kept) e.ratio /= total;
	}
	return kept;
}

double complementaryScore(const Palette& palette)
{
	return clamp01(pairAggregate(palette, [](double d) {
		return gaussian(180.0 - d, kComplementarySigma);
	}));
}

double analogousScore(const Palette& palette)
{
	return clamp01(pairAggregate(palette, [](double d) {
		return d <= kAnalogousWindow ? 1.0 : gaussian(d - kAnalogousWindow, kAnalogousSigma);
	}));
}

double monochromaticScore(const Palette& palette, double min_saturation, double min_value)
{
	if (palette.empty()) return 0.0;

	Palette chromatic = chromaticEntries(palette, min_saturation, min_value);
	double hueTerm = chromatic.size() < 2 ? 1.0 : pairAggregate(chromatic, [](double d) {
		return gaussian(d, kMonochromaticHueSigma);
	});

	// Ratio-weighted spread of saturation and value around their means
	double total = 0.0, meanS = 0.0, meanV = 0.0;
	for (const PaletteEntry& e : palette) {
		total += e.ratio;
		meanS += e.ratio * e.hsv[1];
		meanV += e.ratio * e.hsv[2];
	}
	if (total <= 0.0) return 0.0;
	meanS /= total;
	meanV /= total;

	double varS = 0.0, varV = 0.0;
	for (const PaletteEntry& e : palette) {
		varS += e.ratio * (e.hsv[1] - meanS) * (e.hsv[1] - meanS);
		varV += e.ratio * (e.hsv[2] - meanV) * (e.hsv[2] - meanV);
	}
	double spread = std::sqrt((varS + varV) / (2.0 * total)) / 255.0;
	double svTerm = spread <= kMonochromaticSpreadBound
		? 1.0
		: gaussian(spread - kMonochromaticSpreadBound, kMonochromaticSpreadSigma);

	return clamp01(hueTerm * svTerm);
}

double splitComplementaryScore(const Palette& palette)
{
	return clamp01(tripleAggregate(palette, [](double ab, double ac, double bc) {
		auto g = [](double d, double ideal) { return gaussian(d - ideal, kSplitComplementarySigma); };
		// Any of the three may be the base: 150 degrees to both others, which sit 60 degrees apart
		double baseA = g(ab, 150.0) * g(ac, 150.0) * g(bc, 60.0);
		double baseB = g(ab, 150.0) * g(bc, 150.0) * g(ac, 60.0);
		double baseC = g(ac, 150.0) * g(bc, 150.0) * g(ab, 60.0);
		return std::max(baseA, std::max(baseB, baseC));
	}));
}

double triadicScore(const Palette& palette)
{
	return clamp01(tripleAggregate(palette, [](double ab, double ac, double bc) {
		return gaussian(ab - 120.0, kTriadicSigma) * gaussian(ac - 120.0, kTriadicSigma) * gaussian(bc - 120.0, kTriadicSigma);
	}));
}

HarmonyScores computeHarmonyScores(
	const Palette& palette,
	double negligibility_threshold,
	double min_saturation,
	double min_value)
{
	if (palette.empty()) throw EmptyPaletteError("computeHarmonyScores: palette has no entries");

	Palette significant = significantEntries(palette, negligibility_threshold);
	// Pair and triple terms are ratio-weighted means, so the chromatic subset needs no renormalization
	Palette chromatic = chromaticEntries(significant, min_saturation, min_value);

	HarmonyScores scores;
	scores[HARMONY_COMPLEMENTARY] = complementaryScore(chromatic);
	scores[HARMONY_ANALOGOUS] = analogousScore(chromatic);
	scores[HARMONY_MONOCHROMATIC] = monochromaticScore(significant, min_saturation, min_value);
	scores[HARMONY_SPLIT_COMPLEMENTARY] = splitComplementaryScore(chromatic);
	scores[HARMONY_TRIADIC] = triadicScore(chromatic);
	return scores;
}
