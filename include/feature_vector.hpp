#pragma once
#include <opencv2/core.hpp>
#include "harmony.hpp"
#include "hsv_stats.hpp"

// Field order of a feature vector. This order is the contract with the external classifier and must not
// change between training and scoring.
enum FeatureField {
	FEATURE_COMPLEMENTARY = 0,
	FEATURE_ANALOGOUS = 1,
	FEATURE_MONOCHROMATIC = 2,
	FEATURE_SPLIT_COMPLEMENTARY = 3,
	FEATURE_TRIADIC = 4,
	FEATURE_WEIGHTED_OVERALL = 5,
	FEATURE_DOMINANT_H = 6,
	FEATURE_DOMINANT_S = 7,
	FEATURE_DOMINANT_V = 8,
	FEATURE_MEAN_H = 9,
	FEATURE_MEAN_S = 10,
	FEATURE_MEAN_V = 11,
	FEATURE_DOMINANT_RATIO = 12,
	FEATURE_COUNT = 13
};

typedef cv::Vec<double, FEATURE_COUNT> FeatureVector;

// Non-negative weights combining the harmony metrics, summing to 1
typedef cv::Vec<double, HARMONY_METRIC_COUNT> WeightVector;

// snake_case name of a field ("complementary", "weighted_overall", "dominant_h", ...)
const char* featureFieldName(FeatureField field);

// True for the two hue fields, which need circular arithmetic
bool isHueField(FeatureField field);

// Equal weights (1/5 each)
WeightVector uniformWeights();

// Weighted combination of the harmony scores: sum(weights[i] * scores[i])
double weightedOverall(const HarmonyScores& scores, const WeightVector& weights);

// Assemble the feature vector of one image.
// Non-finite values are replaced by 0 so the vector can always be handed to the classifier.
//
// Args:
//   scores: harmony scores of the image's palette
//   stats: HSV statistics of the same palette
//   weights: weights of the target style (uniformWeights() when none were learned)
//
// Returns:
//   The FeatureVector, laid out as in FeatureField
FeatureVector buildFeatureVector(const HarmonyScores& scores, const HsvStatistics& stats, const WeightVector& weights);

// The harmony part (first five fields) of a feature vector
HarmonyScores harmonyPart(const FeatureVector& features);
