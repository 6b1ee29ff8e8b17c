#pragma once
#include <string>

// Options consumed by the engine. Passed by value/reference into every call, never held globally,
// so independent images can be analyzed concurrently with different settings.
struct HarmonyConfig {
	// Palette extraction
	int k = 5;                  // fixed cluster count, used when auto_k is false
	bool auto_k = false;        // pick k with the elbow heuristic in [k_min, k_max]
	int k_min = 2;
	int k_max = 8;
	int kmeans_max_iter = 50;   // iteration cap for a single k-means run, in [2, 100] (cv::kmeans clamps to that range)
	double kmeans_epsilon = 0.5; // stop once no centroid moves more than this (HSV units)

	// Sampling
	int sample_cap = 20000;     // maximum number of pixels handed to clustering (0 = no cap)
	int resize_width = 600;
	int resize_height = 400;
	bool keep_aspect = true;    // fit inside the target box instead of stretching to it
	bool allow_upscale = false; // enlarge images that already fit inside the target box
	int min_dimension = 32;     // smaller sides raise ImageTooSmall
	unsigned int seed = 0x5eed; // base seed, combined with image content for per-image seeds

	// Harmony and weighting
	double negligibility_threshold = 0.02; // palette entries below this ratio are ignored by the metrics
	double achromatic_saturation = 25.0;   // colors with S or V below these have no hue (white, grey, black)
	double achromatic_value = 25.0;
	bool auto_weight_learning = false;

	// Gap analysis
	int suggestion_count = 3;   // how many of the largest deltas get a hint
};

// Check that every option is in range
//
// Throws:
//   std::invalid_argument naming the first offending option
void validateConfig(const HarmonyConfig& config);

// Read a configuration from a YAML/JSON/XML file with cv::FileStorage.
// Missing keys keep their defaults. `k` may be an integer or the string "auto";
// boolean options may be integers or "true"/"false" strings.
//
// Args:
//   path: configuration file
//
// Returns:
//   The validated configuration
//
// Throws:
//   std::invalid_argument if the file cannot be opened or holds invalid values
HarmonyConfig loadHarmonyConfig(const std::string& path);
