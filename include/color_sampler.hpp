#pragma once
#include <opencv2/core.hpp>
#include <cstdint>
#include <vector>
#include "config.hpp"
#include "diagnostics.hpp"

// A sample set is the ordered list of pixel colors clustering works on.
// - `hsv`: the sampled pixels in OpenCV's 8-bit HSV (H in [0, 179], S and V in [0, 255]), in raster order
// - `working_size`: size of the image after resizing to the working resolution
// - `total_pixels`: pixel count of the resized image, before any subsampling
//
// Resizing and subsampling only thin the pixels out; relative color proportions are kept up to sampling noise.
struct SampleSet {
	std::vector<cv::Vec3b> hsv;
	cv::Size working_size;
	int total_pixels = 0;
};

// Derive a per-image seed from the pixel content and a base seed (FNV-1a over the pixel bytes).
// The same image always gets the same seed, so sampling and clustering are reproducible.
uint64_t imageSeed(const cv::Mat& image, unsigned int base_seed);

// Size the image is resized to before sampling
//
// Args:
//   source: size of the decoded image
//   config: resize_width, resize_height, keep_aspect and allow_upscale are used
//
// Returns:
//   The working size (never smaller than 1x1)
cv::Size workingSize(const cv::Size& source, const HarmonyConfig& config);

// Build a sample set from a decoded image.
// The image is resized to the working size (area interpolation when shrinking, nearest when enlarging so
// no new colors appear), converted to HSV and, if it holds more than config.sample_cap pixels,
// uniformly subsampled without replacement using `seed`.
//
// Args:
//   image: decoded image (cv::Mat, 8-bit BGR; grayscale and BGRA are converted to BGR)
//   config: sampling options
//   seed: random seed for subsampling (see imageSeed)
//   diagnostics: receives WARN_IMAGE_TOO_SMALL when the image is below config.min_dimension (may be null)
//
// Returns:
//   The SampleSet of the image
//
// Throws:
//   std::invalid_argument if the image is empty
SampleSet sampleImage(const cv::Mat& image, const HarmonyConfig& config, uint64_t seed, Diagnostics* diagnostics = nullptr);
