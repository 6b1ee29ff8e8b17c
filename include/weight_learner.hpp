#pragma once
#include <opencv2/core.hpp>
#include <vector>
#include "diagnostics.hpp"
#include "feature_vector.hpp"

// Outcome of weight learning for one style
// - `weights`: the normalized non-negative weights to use
// - `coefficients`: raw logistic-regression coefficients of the harmony fields (bias excluded), kept for auditing
// - `degenerate`: true when no coefficient was positive and uniform weights were substituted
struct WeightLearningResult {
	WeightVector weights;
	cv::Vec<double, HARMONY_METRIC_COUNT> coefficients;
	bool degenerate = false;
};

// Coefficients at or below this value are treated as zero (gradient descent noise on balanced data)
const double kWeightCoefficientFloor = 1e-4;

// Clip coefficients to >= 0 and normalize them to sum to 1.
// Returns false (and leaves `weights` uniform) if nothing above kWeightCoefficientFloor remains.
bool normalizeCoefficients(const cv::Vec<double, HARMONY_METRIC_COUNT>& coefficients, WeightVector& weights);

// Learn harmony weights from a style's positive and negative examples.
// Only the five raw harmony fields take part; the weighted overall and HSV fields are ignored.
// A logistic regression separates positives from negatives, its coefficients are clipped and normalized.
//
// Args:
//   positives: feature vectors of the style's positive images
//   negatives: feature vectors of the style's negative images
//   diagnostics: receives WARN_DEGENERATE_WEIGHTS when uniform weights are substituted (may be null)
//
// Returns:
//   The WeightLearningResult
WeightLearningResult learnWeights(
	const std::vector<FeatureVector>& positives,
	const std::vector<FeatureVector>& negatives,
	Diagnostics* diagnostics = nullptr
);
