#include "color_sampler.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>
#include <sstream>
#include <stdexcept>

// FNV-1a over the pixel bytes, row by row (images may be non-continuous ROIs)
uint64_t imageSeed(const cv::Mat& image, unsigned int base_seed)
{
	const uint64_t prime = 1099511628211ULL;
	uint64_t h = 14695981039346656037ULL ^ (uint64_t)base_seed;

	auto mix = [&h, prime](uint64_t v) {
		for (int i = 0; i < 8; ++i) {
			h ^= (v >> (8 * i)) & 0xff;
			h *= prime;
		}
	};
	mix((uint64_t)image.rows);
	mix((uint64_t)image.cols);
	mix((uint64_t)image.type());

	size_t rowBytes = (size_t)image.cols * image.elemSize();
	for (int r = 0; r < image.rows; ++r) {
		const uchar* row = image.ptr<uchar>(r);
		for (size_t i = 0; i < rowBytes; ++i) {
			h ^= row[i];
			h *= prime;
		}
	}
	return h;
}

cv::Size workingSize(const cv::Size& source, const HarmonyConfig& config)
{
	cv::Size target(config.resize_width, config.resize_height);
	bool fits = source.width <= target.width && source.height <= target.height;

	// Small images are left alone unless enlarging was asked for
	if (fits && !config.allow_upscale) return source;
	if (!config.keep_aspect) return target;

	double scale = std::min((double)target.width / source.width, (double)target.height / source.height);
	return cv::Size(
		std::max(1, (int)std::lround(source.width * scale)),
		std::max(1, (int)std::lround(source.height * scale)));
}

// Bring grayscale and BGRA inputs to 3-channel BGR
static cv::Mat toBgr(const cv::Mat& image)
{
	CV_Assert(image.depth() == CV_8U); // 8-bit images only

	cv::Mat bgr;
	switch (image.channels()) {
	case 1:
		cv::cvtColor(image, bgr, cv::COLOR_GRAY2BGR);
		return bgr;
	case 3:
		return image;
	case 4:
		cv::cvtColor(image, bgr, cv::COLOR_BGRA2BGR);
		return bgr;
	default:
		throw std::invalid_argument("sampleImage: unsupported channel count " + std::to_string(image.channels()));
	}
}

SampleSet sampleImage(const cv::Mat& image, const HarmonyConfig& config, uint64_t seed, Diagnostics* diagnostics)
{
	if (image.empty()) throw std::invalid_argument("sampleImage: empty image");

	if (std::min(image.cols, image.rows) < config.min_dimension) {
		std::ostringstream msg;
		msg << "image is " << image.cols << "x" << image.rows << ", below the minimum dimension of "
			<< config.min_dimension << " pixels; continuing with what is there";
		reportWarning(diagnostics, WARN_IMAGE_TOO_SMALL, msg.str());
	}

	cv::Mat bgr = toBgr(image);

	cv::Size size = workingSize(bgr.size(), config);
	cv::Mat resized;
	if (size == bgr.size()) {
		resized = bgr;
	}
	else {
		// Area interpolation averages whole source pixels when shrinking; when enlarging,
		// nearest-neighbour only repeats existing colors
		bool shrinking = (double)size.area() < (double)bgr.size().area();
		cv::resize(bgr, resized, size, 0, 0, shrinking ? cv::INTER_AREA : cv::INTER_NEAREST);
	}

	cv::Mat hsv;
	cv::cvtColor(resized, hsv, cv::COLOR_BGR2HSV); // 8-bit hue lands in [0, 179]

	SampleSet samples;
	samples.working_size = hsv.size();
	samples.total_pixels = hsv.rows * hsv.cols;

	std::vector<cv::Vec3b> pixels;
	pixels.reserve(samples.total_pixels);
	for (int r = 0; r < hsv.rows; ++r) {
		const cv::Vec3b* row = hsv.ptr<cv::Vec3b>(r);
		pixels.insert(pixels.end(), row, row + hsv.cols);
	}

	int cap = config.sample_cap;
	if (cap <= 0 || samples.total_pixels <= cap) {
		samples.hsv = std::move(pixels);
		return samples;
	}

	// Uniform subsampling without replacement: partial Fisher-Yates over the pixel indices,
	// then back to raster order
	std::vector<int> indices(samples.total_pixels);
	std::iota(indices.begin(), indices.end(), 0);
	std::mt19937_64 gen(seed);
	for (int i = 0; i < cap; ++i) {
		std::uniform_int_distribution<int> pick(i, samples.total_pixels - 1);
		std::swap(indices[i], indices[pick(gen)]);
	}
	indices.resize(cap);
	std::sort(indices.begin(), indices.end());

	samples.hsv.reserve(cap);
	for (int idx : indices) samples.hsv.push_back(pixels[idx]);
	return samples;
}
