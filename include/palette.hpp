#pragma once
#include <opencv2/core.hpp>
#include <cstdint>
#include <vector>
#include "color_sampler.hpp"
#include "config.hpp"
#include "diagnostics.hpp"

// One representative color of an image.
// - `hsv`: the cluster centroid (H in [0, 180), S and V in [0, 255])
// - `ratio`: fraction of the sampled pixels that belong to this cluster (0 < ratio <= 1)
struct PaletteEntry {
	cv::Vec3d hsv;
	double ratio = 0.0;
};

// Palette entries are sorted by descending ratio, equal ratios by ascending hue. Ratios sum to 1.
typedef std::vector<PaletteEntry> Palette;

// Result of one seeded k-means run over a sample set
// - `labels`: cluster index of every sample
// - `inertia`: sum of squared distances of the samples to their centroid
struct ClusteringResult {
	std::vector<int> labels;
	int k = 0;
	double inertia = 0.0;
};

// Project an HSV color into the space clustering runs in.
// The hue goes on a circle whose radius makes the chord equal to the hue difference for nearby hues,
// so hues 1 and 178 are neighbours instead of opposite ends of a line.
cv::Vec4f clusteringFeature(const cv::Vec3b& hsv);

// Number of distinct colors in the sample set
int countDistinctColors(const SampleSet& samples);

// Cluster the samples into k groups.
// A few k-means++ starts derived from `seed` are run and the one with the lowest inertia is kept; each run
// stops when no centroid moves more than config.kmeans_epsilon or after config.kmeans_max_iter iterations.
//
// Args:
//   samples: the sample set (must hold at least k distinct colors)
//   k: number of clusters
//   config: iteration options
//   seed: initialization seed
//
// Returns:
//   Labels and inertia of the run
ClusteringResult clusterSamples(const SampleSet& samples, int k, const HarmonyConfig& config, uint64_t seed);

// Pick k at the elbow of an inertia curve.
// The curve is normalized to [0, 1] and the k with the largest second difference wins; ties go to the
// smaller k. Curves with fewer than three points, flat curves and curves without positive curvature
// select `k_first`.
//
// Args:
//   inertias: inertia for k = k_first, k_first + 1, ...
//   k_first: the k of inertias[0]
//
// Returns:
//   The selected k
int selectElbowK(const std::vector<double>& inertias, int k_first);

// Turn cluster labels into a sorted palette (ratio = cluster size / sample count)
Palette buildPalette(const SampleSet& samples, const ClusteringResult& clustering);

// Extract the palette of a sample set, with a fixed k or the elbow heuristic (config.auto_k).
// k is clamped to the number of distinct colors (WARN_INSUFFICIENT_SAMPLES).
//
// Args:
//   samples: the sample set
//   config: k, auto_k, k_min, k_max and the k-means options are used
//   seed: clustering seed; the same samples, k and seed always give the same palette
//   diagnostics: receives warnings (may be null)
//   inertia_curve: if not null, receives the inertia of every k tried
//
// Returns:
//   The Palette (at least one entry)
//
// Throws:
//   std::invalid_argument if the sample set is empty
Palette extractPalette(
	const SampleSet& samples,
	const HarmonyConfig& config,
	uint64_t seed,
	Diagnostics* diagnostics = nullptr,
	std::vector<double>* inertia_curve = nullptr
);
