#include "harmony_engine.hpp"
#include "color_sampler.hpp"
#include "image_io.hpp"
#include "threadpool.hpp"
#include "weight_learner.hpp"
#include <opencv2/core/utils/logger.hpp>
#include <algorithm>
#include <exception>
#include <functional>
#include <string>

ColorAnalysis analyzeImage(const cv::Mat& image, const HarmonyConfig& config)
{
	ColorAnalysis analysis;
	uint64_t seed = imageSeed(image, config.seed);

	SampleSet samples = sampleImage(image, config, seed, &analysis.diagnostics);
	analysis.palette = extractPalette(samples, config, seed, &analysis.diagnostics);
	analysis.statistics = computeHsvStatistics(analysis.palette, config.achromatic_saturation, config.achromatic_value);
	analysis.harmony = computeHarmonyScores(analysis.palette, config.negligibility_threshold,
		config.achromatic_saturation, config.achromatic_value);
	return analysis;
}

FeatureVector featuresOf(const ColorAnalysis& analysis, const WeightVector& weights)
{
	return buildFeatureVector(analysis.harmony, analysis.statistics, weights);
}

// Run `analyze(i)` for every item on a pool. Each task only writes its own slot, and an exception
// thrown for one image is recorded in that item instead of reaching the pool.
static void runBatch(std::vector<BatchItem>& items, const std::function<ColorAnalysis(size_t)>& analyze, unsigned int num_threads)
{
	if (items.empty()) return;

	ThreadPool pool(std::min<size_t>(batchThreadCount(num_threads), items.size()));
	for (size_t i = 0; i < items.size(); ++i) {
		pool.enqueue([&items, &analyze, i]() {
			BatchItem& item = items[i];
			try {
				item.analysis = analyze(i);
				item.ok = true;
			}
			catch (const std::exception& e) {
				item.ok = false;
				item.error = e.what();
				CV_LOG_WARNING(NULL, "skipping " << item.id << ": " << e.what());
			}
		});
	}
	pool.waitUntilEmpty();
}

std::vector<BatchItem> analyzeImages(const std::vector<cv::Mat>& images, const HarmonyConfig& config, unsigned int num_threads)
{
	std::vector<BatchItem> items(images.size());
	for (size_t i = 0; i < images.size(); ++i) items[i].id = "#" + std::to_string(i);

	runBatch(items, [&](size_t i) { return analyzeImage(images[i], config); }, num_threads);
	return items;
}

std::vector<BatchItem> analyzeImageFiles(const std::vector<std::string>& paths, const HarmonyConfig& config, unsigned int num_threads)
{
	std::vector<BatchItem> items(paths.size());
	for (size_t i = 0; i < paths.size(); ++i) items[i].id = paths[i];

	runBatch(items, [&](size_t i) { return analyzeImage(loadImage(paths[i]), config); }, num_threads);
	return items;
}

std::vector<ColorAnalysis> successfulAnalyses(const std::vector<BatchItem>& items)
{
	std::vector<ColorAnalysis> out;
	for (const BatchItem& item : items) {
		if (item.ok) out.push_back(item.analysis);
	}
	return out;
}

StyleProfile buildStyleProfile(
	const std::string& name,
	const std::vector<ColorAnalysis>& positives,
	const std::vector<ColorAnalysis>& negatives,
	const HarmonyConfig& config,
	Diagnostics* diagnostics)
{
	StyleProfile style;
	style.name = name;
	style.weights = uniformWeights();

	// Weights only read the harmony fields, so a first pass with uniform weights is enough to learn them
	if (config.auto_weight_learning) {
		std::vector<FeatureVector> pos, neg;
		for (const ColorAnalysis& a : positives) pos.push_back(featuresOf(a, style.weights));
		for (const ColorAnalysis& a : negatives) neg.push_back(featuresOf(a, style.weights));

		WeightLearningResult learned = learnWeights(pos, neg, diagnostics);
		style.weights = learned.weights;
		style.learned_weights = !learned.degenerate;
	}

	for (const ColorAnalysis& a : positives) style.positives.push_back(featuresOf(a, style.weights));
	for (const ColorAnalysis& a : negatives) style.negatives.push_back(featuresOf(a, style.weights));
	return style;
}

GapReport evaluateAgainstStyle(const ColorAnalysis& analysis, const StyleProfile& style, const HarmonyConfig& config)
{
	return analyzeGap(featuresOf(analysis, style.weights), style.positives, config.suggestion_count);
}
