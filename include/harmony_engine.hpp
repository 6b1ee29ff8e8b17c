#pragma once
#include <opencv2/core.hpp>
#include <string>
#include <vector>
#include "config.hpp"
#include "diagnostics.hpp"
#include "feature_vector.hpp"
#include "gap_analyzer.hpp"
#include "harmony.hpp"
#include "hsv_stats.hpp"
#include "palette.hpp"

// Everything computed from one image that does not depend on a style
struct ColorAnalysis {
	Palette palette;
	HsvStatistics statistics;
	HarmonyScores harmony;
	Diagnostics diagnostics;
};

// Outcome of one image in a batch
// - `id`: the file path (or the index for in-memory images)
// - `ok`: false if the image could not be loaded or analyzed; `error` then holds the reason
struct BatchItem {
	std::string id;
	bool ok = false;
	std::string error;
	ColorAnalysis analysis;
};

// A decorating style: its positive and negative examples and the weights scoped to it
struct StyleProfile {
	std::string name;
	std::vector<FeatureVector> positives;
	std::vector<FeatureVector> negatives;
	WeightVector weights;
	bool learned_weights = false;
};

// Sample, cluster and score one image. The seed is derived from the image content and config.seed,
// so repeated calls on the same image with the same configuration give identical results.
//
// Args:
//   image: decoded image (cv::Mat, 8-bit BGR)
//   config: engine configuration
//
// Returns:
//   The ColorAnalysis of the image, with any warnings in its diagnostics
ColorAnalysis analyzeImage(const cv::Mat& image, const HarmonyConfig& config);

// Feature vector of an analyzed image under the given weights
FeatureVector featuresOf(const ColorAnalysis& analysis, const WeightVector& weights);

// Analyze in-memory images on a thread pool. A failing image is reported in its own item and does not
// stop the others. Items come back in input order.
//
// Args:
//   images: decoded images
//   config: engine configuration
//   num_threads: worker count (0 = hardware concurrency)
std::vector<BatchItem> analyzeImages(const std::vector<cv::Mat>& images, const HarmonyConfig& config, unsigned int num_threads = 0);

// Same as analyzeImages, loading each file first (load failures are reported per item)
std::vector<BatchItem> analyzeImageFiles(const std::vector<std::string>& paths, const HarmonyConfig& config, unsigned int num_threads = 0);

// Analyses of the successful items of a batch
std::vector<ColorAnalysis> successfulAnalyses(const std::vector<BatchItem>& items);

// Build a style profile from analyzed examples.
// With config.auto_weight_learning the weights are learned from the examples (see learnWeights),
// otherwise they are uniform. Feature vectors are then assembled with those weights.
//
// Args:
//   name: style name
//   positives, negatives: analyses of the style's positive and negative images
//   config: engine configuration
//   diagnostics: receives WARN_DEGENERATE_WEIGHTS (may be null)
StyleProfile buildStyleProfile(
	const std::string& name,
	const std::vector<ColorAnalysis>& positives,
	const std::vector<ColorAnalysis>& negatives,
	const HarmonyConfig& config,
	Diagnostics* diagnostics = nullptr
);

// Gap report of an analyzed image against a style, using the style's weights
//
// Throws:
//   std::invalid_argument if the style has no positive examples
GapReport evaluateAgainstStyle(const ColorAnalysis& analysis, const StyleProfile& style, const HarmonyConfig& config);
