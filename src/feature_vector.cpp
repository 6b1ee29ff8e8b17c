#include "feature_vector.hpp"
#include <cmath>

const char* featureFieldName(FeatureField field)
{
	switch (field) {
	case FEATURE_COMPLEMENTARY: return "complementary";
	case FEATURE_ANALOGOUS: return "analogous";
	case FEATURE_MONOCHROMATIC: return "monochromatic";
	case FEATURE_SPLIT_COMPLEMENTARY: return "split_complementary";
	case FEATURE_TRIADIC: return "triadic";
	case FEATURE_WEIGHTED_OVERALL: return "weighted_overall";
	case FEATURE_DOMINANT_H: return "dominant_h";
	case FEATURE_DOMINANT_S: return "dominant_s";
	case FEATURE_DOMINANT_V: return "dominant_v";
	case FEATURE_MEAN_H: return "mean_h";
	case FEATURE_MEAN_S: return "mean_s";
	case FEATURE_MEAN_V: return "mean_v";
	case FEATURE_DOMINANT_RATIO: return "dominant_ratio";
	default: return "unknown";
	}
}

bool isHueField(FeatureField field)
{
	return field == FEATURE_DOMINANT_H || field == FEATURE_MEAN_H;
}

WeightVector uniformWeights()
{
	WeightVector w;
	for (int i = 0; i < HARMONY_METRIC_COUNT; ++i) w[i] = 1.0 / HARMONY_METRIC_COUNT;
	return w;
}

double weightedOverall(const HarmonyScores& scores, const WeightVector& weights)
{
	double overall = 0.0;
	for (int i = 0; i < HARMONY_METRIC_COUNT; ++i) overall += weights[i] * scores[i];
	return overall;
}

FeatureVector buildFeatureVector(const HarmonyScores& scores, const HsvStatistics& stats, const WeightVector& weights)
{
	FeatureVector f;
	for (int i = 0; i < HARMONY_METRIC_COUNT; ++i) f[i] = scores[i]; // harmony fields share the metric order
	f[FEATURE_WEIGHTED_OVERALL] = weightedOverall(scores, weights);
	f[FEATURE_DOMINANT_H] = stats.dominant[0];
	f[FEATURE_DOMINANT_S] = stats.dominant[1];
	f[FEATURE_DOMINANT_V] = stats.dominant[2];
	f[FEATURE_MEAN_H] = stats.mean[0];
	f[FEATURE_MEAN_S] = stats.mean[1];
	f[FEATURE_MEAN_V] = stats.mean[2];
	f[FEATURE_DOMINANT_RATIO] = stats.dominant_ratio;

	// The classifier only ever sees finite values
	for (int i = 0; i < FEATURE_COUNT; ++i) {
		if (!std::isfinite(f[i])) f[i] = 0.0;
	}
	return f;
}

HarmonyScores harmonyPart(const FeatureVector& features)
{
	HarmonyScores scores;
	for (int i = 0; i < HARMONY_METRIC_COUNT; ++i) scores[i] = features[i];
	return scores;
}
