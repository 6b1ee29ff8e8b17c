#include "palette.hpp"
#include "hsv_stats.hpp"
#include <opencv2/core/utils/logger.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <random>
#include <sstream>
#include <stdexcept>

// Radius of the hue circle: a chord between nearby hues is as long as their difference in hue units
static const double kHueRadius = 180.0 / (2.0 * CV_PI);

// Seeded restarts per clustering; the run with the lowest inertia is kept
static const int kKMeansAttempts = 3;

cv::Vec4f clusteringFeature(const cv::Vec3b& hsv)
{
	double angle = hsv[0] * CV_PI / 90.0; // half-scale hue to radians
	return cv::Vec4f(
		(float)(kHueRadius * std::cos(angle)),
		(float)(kHueRadius * std::sin(angle)),
		(float)hsv[1],
		(float)hsv[2]
	);
}

static float squaredDistance(const float* a, const float* b)
{
	float d2 = 0.0f;
	for (int d = 0; d < 4; ++d) {
		float diff = a[d] - b[d];
		d2 += diff * diff;
	}
	return d2;
}

int countDistinctColors(const SampleSet& samples)
{
	std::vector<uint32_t> packed;
	packed.reserve(samples.hsv.size());
	for (const cv::Vec3b& p : samples.hsv)
		packed.push_back(((uint32_t)p[0] << 16) | ((uint32_t)p[1] << 8) | (uint32_t)p[2]);
	std::sort(packed.begin(), packed.end());
	return (int)(std::unique(packed.begin(), packed.end()) - packed.begin());
}

// k-means++ seeding: first center uniformly, every next one with probability proportional to the squared
// distance to the closest center chosen so far. Returns the initial label of every sample.
static cv::Mat seedLabels(const cv::Mat& data, int k, uint64_t seed)
{
	int n = data.rows;
	std::mt19937_64 gen(seed);
	std::vector<int> centerRows;
	centerRows.reserve(k);

	std::uniform_int_distribution<int> first(0, n - 1);
	centerRows.push_back(first(gen));

	std::vector<double> closest(n, std::numeric_limits<double>::max());
	while ((int)centerRows.size() < k) {
		const float* c = data.ptr<float>(centerRows.back());
		double total = 0.0;
		for (int i = 0; i < n; ++i) {
			closest[i] = std::min(closest[i], (double)squaredDistance(data.ptr<float>(i), c));
			total += closest[i];
		}
		if (total <= 0.0) break; // every sample sits on a center already

		std::uniform_real_distribution<double> pick(0.0, total);
		double target = pick(gen);
		int chosen = -1;
		double acc = 0.0;
		for (int i = 0; i < n; ++i) {
			if (closest[i] <= 0.0) continue;
			acc += closest[i];
			chosen = i;
			if (acc >= target) break;
		}
		centerRows.push_back(chosen);
	}

	cv::Mat labels(n, 1, CV_32S);
	for (int i = 0; i < n; ++i) {
		const float* p = data.ptr<float>(i);
		int bestIdx = 0;
		float bestDist2 = std::numeric_limits<float>::max();
		for (int ci = 0; ci < (int)centerRows.size(); ++ci) {
			float d2 = squaredDistance(p, data.ptr<float>(centerRows[ci]));
			if (d2 < bestDist2) { bestDist2 = d2; bestIdx = ci; }
		}
		labels.at<int>(i) = bestIdx;
	}
	return labels;
}

ClusteringResult clusterSamples(const SampleSet& samples, int k, const HarmonyConfig& config, uint64_t seed)
{
	int n = (int)samples.hsv.size();
	CV_Assert(k >= 1 && k <= n); // Callers clamp k to the distinct colors available

	cv::Mat data(n, 4, CV_32F);
	for (int i = 0; i < n; ++i) {
		cv::Vec4f f = clusteringFeature(samples.hsv[i]);
		for (int d = 0; d < 4; ++d) data.at<float>(i, d) = f[d];
	}

	cv::TermCriteria criteria(cv::TermCriteria::EPS + cv::TermCriteria::MAX_ITER, config.kmeans_max_iter, config.kmeans_epsilon);

	ClusteringResult result;
	result.k = k;
	result.inertia = std::numeric_limits<double>::max();
	for (int attempt = 0; attempt < kKMeansAttempts; ++attempt) {
		// The initial labels carry our own seeded k-means++ start, so a single cv::kmeans attempt with
		// KMEANS_USE_INITIAL_LABELS never touches OpenCV's global RNG
		cv::Mat labels = seedLabels(data, k, seed + attempt * 0x9e3779b97f4a7c15ULL);
		cv::Mat centers;
		double inertia = cv::kmeans(data, k, labels, criteria, 1, cv::KMEANS_USE_INITIAL_LABELS, centers);

		// Strictly lower: on equal inertia the earlier attempt wins
		if (inertia < result.inertia) {
			result.inertia = inertia;
			result.labels.assign(labels.begin<int>(), labels.end<int>());
		}
	}
	return result;
}

int selectElbowK(const std::vector<double>& inertias, int k_first)
{
	if (inertias.size() < 3) return k_first;

	double lo = *std::min_element(inertias.begin(), inertias.end());
	double hi = *std::max_element(inertias.begin(), inertias.end());
	if (!(hi - lo > 1e-12 * std::max(1.0, std::abs(hi)))) return k_first; // flat curve

	int best = -1;
	double bestCurvature = 0.0;
	for (size_t i = 1; i + 1 < inertias.size(); ++i) {
		double prev = (inertias[i - 1] - lo) / (hi - lo);
		double cur = (inertias[i] - lo) / (hi - lo);
		double next = (inertias[i + 1] - lo) / (hi - lo);
		double curvature = prev - 2.0 * cur + next;
		// Strictly greater: equal curvature keeps the smaller k
		if (curvature > bestCurvature + 1e-12) {
			bestCurvature = curvature;
			best = (int)i;
		}
	}
	return best < 0 ? k_first : k_first + best;
}

Palette buildPalette(const SampleSet& samples, const ClusteringResult& clustering)
{
	int k = clustering.k;
	std::vector<std::vector<double>> hues(k);
	std::vector<double> satSum(k, 0.0), valSum(k, 0.0);

	for (size_t i = 0; i < samples.hsv.size(); ++i) {
		int c = clustering.labels[i];
		const cv::Vec3b& p = samples.hsv[i];
		hues[c].push_back(p[0]);
		satSum[c] += p[1];
		valSum[c] += p[2];
	}

	double total = (double)samples.hsv.size();
	Palette palette;
	for (int c = 0; c < k; ++c) {
		size_t count = hues[c].size();
		if (count == 0) continue; // a ratio of 0 never makes it into a palette

		PaletteEntry entry;
		entry.hsv = cv::Vec3d(
			circularMeanHue(hues[c], std::vector<double>(count, 1.0)),
			satSum[c] / count,
			valSum[c] / count);
		entry.ratio = count / total;
		palette.push_back(entry);
	}

	std::sort(palette.begin(), palette.end(), [](const PaletteEntry& a, const PaletteEntry& b) {
		if (a.ratio != b.ratio) return a.ratio > b.ratio;
		return a.hsv[0] < b.hsv[0];
	});
	return palette;
}

Palette extractPalette(
	const SampleSet& samples,
	const HarmonyConfig& config,
	uint64_t seed,
	Diagnostics* diagnostics,
	std::vector<double>* inertia_curve)
{
	if (samples.hsv.empty()) throw std::invalid_argument("extractPalette: empty sample set");

	int distinct = countDistinctColors(samples);

	auto clampToDistinct = [&](int k) {
		if (k <= distinct) return k;
		std::ostringstream msg;
		msg << "requested k=" << k << " but only " << distinct << " distinct colors were sampled; using k=" << distinct;
		reportWarning(diagnostics, WARN_INSUFFICIENT_SAMPLES, msg.str());
		return distinct;
	};

	if (!config.auto_k) {
		int k = clampToDistinct(std::max(1, config.k));
		ClusteringResult result = clusterSamples(samples, k, config, seed);
		if (inertia_curve) inertia_curve->assign(1, result.inertia);
		return buildPalette(samples, result);
	}

	int kMax = clampToDistinct(std::max(1, config.k_max));
	int kMin = std::min(std::max(1, config.k_min), kMax);

	std::vector<ClusteringResult> runs;
	std::vector<double> inertias;
	for (int k = kMin; k <= kMax; ++k) {
		runs.push_back(clusterSamples(samples, k, config, seed));
		inertias.push_back(runs.back().inertia);
	}

	int chosen = selectElbowK(inertias, kMin);
	CV_LOG_DEBUG(NULL, "elbow selected k=" << chosen << " from [" << kMin << ", " << kMax << "]");

	if (inertia_curve) *inertia_curve = inertias;
	return buildPalette(samples, runs[chosen - kMin]);
}
