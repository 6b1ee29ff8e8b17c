#include "classifier.hpp"
#include "config.hpp"
#include "harmony_engine.hpp"
#include "image_io.hpp"
#include <opencv2/core.hpp>
#include <opencv2/core/utils/logger.hpp>
#include <exception>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

static const char* const kKeys =
	"{help h usage ? |       | print this message}"
	"{config c       |       | engine configuration (YAML/JSON/XML)}"
	"{style s        | style | style name}"
	"{positive p     |       | directory of style-positive images}"
	"{negative n     |       | directory of style-negative images}"
	"{export e       |       | write the labeled training set to this file (.yml/.json/.xml)}"
	"{threads t      | 0     | worker threads for batch analysis (0 = all cores)}"
	"{verbose v      |       | log informational messages}"
	"{@image         |       | image to evaluate}";

static void printAnalysis(const ColorAnalysis& analysis, const FeatureVector& features)
{
	std::cout << std::fixed << std::setprecision(3);

	std::cout << "Palette:" << std::endl;
	for (const PaletteEntry& e : analysis.palette) {
		std::cout << "  H " << std::setw(7) << e.hsv[0] << "  S " << std::setw(7) << e.hsv[1]
			<< "  V " << std::setw(7) << e.hsv[2] << "  ratio " << e.ratio << std::endl;
	}

	const HsvStatistics& s = analysis.statistics;
	std::cout << "Dominant color: " << s.dominant << " (" << s.dominant_ratio << " of the area)" << std::endl;
	std::cout << "Mean color:     " << s.mean << std::endl;

	std::cout << "Feature vector:" << std::endl;
	for (int i = 0; i < FEATURE_COUNT; ++i)
		std::cout << "  " << std::setw(20) << std::left << featureFieldName((FeatureField)i) << std::right << features[i] << std::endl;

	for (const Diagnostic& d : analysis.diagnostics)
		std::cout << "Warning (" << warningName(d.code) << "): " << d.message << std::endl;
}

static void printGapReport(const GapReport& report)
{
	std::cout << "Gap report:" << std::endl;
	for (const GapEntry& e : report.entries) {
		std::cout << "  " << std::setw(20) << std::left << e.name << std::right
			<< " evaluated " << std::setw(9) << e.evaluated
			<< "  reference " << std::setw(9) << e.reference
			<< "  delta " << std::showpos << std::setw(9) << e.delta << std::noshowpos << std::endl;
	}
	for (const std::string& s : report.suggestions) std::cout << "  - " << s << std::endl;
	std::cout << report.summary << std::endl;
}

// Analyze a directory of examples, reporting the images that failed
static std::vector<ColorAnalysis> analyzeFolder(const std::string& folder, const HarmonyConfig& config, unsigned int threads)
{
	std::vector<std::string> files = listImages(folder);
	std::vector<BatchItem> items = analyzeImageFiles(files, config, threads);
	int failed = 0;
	for (const BatchItem& item : items) {
		if (!item.ok) {
			std::cerr << "Failed: " << item.id << ": " << item.error << std::endl;
			++failed;
		}
	}
	std::cout << folder << ": " << (items.size() - failed) << " of " << items.size() << " images analyzed" << std::endl;
	return successfulAnalyses(items);
}

// Entry point
int main(int argc, char** argv)
{
	cv::CommandLineParser parser(argc, argv, kKeys);
	parser.about("Color harmony analysis of interior photographs against a decorating style");
	if (parser.has("help")) {
		parser.printMessage();
		return 0;
	}

	std::string configPath = parser.get<std::string>("config");
	std::string styleName = parser.get<std::string>("style");
	std::string positiveDir = parser.get<std::string>("positive");
	std::string negativeDir = parser.get<std::string>("negative");
	std::string exportPath = parser.get<std::string>("export");
	int threads = parser.get<int>("threads");
	std::string imagePath = parser.get<std::string>("@image");
	if (!parser.check()) {
		parser.printErrors();
		return 1;
	}

	cv::utils::logging::setLogLevel(parser.has("verbose")
		? cv::utils::logging::LOG_LEVEL_INFO
		: cv::utils::logging::LOG_LEVEL_WARNING);

	try {
		HarmonyConfig config;
		if (!configPath.empty()) config = loadHarmonyConfig(configPath);
		validateConfig(config);
		unsigned int workers = threads > 0 ? (unsigned int)threads : 0;

		bool haveStyle = !positiveDir.empty();
		StyleProfile style;
		if (haveStyle) {
			std::vector<ColorAnalysis> positives = analyzeFolder(positiveDir, config, workers);
			std::vector<ColorAnalysis> negatives;
			if (!negativeDir.empty()) negatives = analyzeFolder(negativeDir, config, workers);

			Diagnostics diagnostics;
			style = buildStyleProfile(styleName, positives, negatives, config, &diagnostics);
			std::cout << "Style '" << style.name << "': " << style.positives.size() << " positive, "
				<< style.negatives.size() << " negative examples, weights " << style.weights
				<< (style.learned_weights ? " (learned)" : " (uniform)") << std::endl;

			if (!exportPath.empty()) {
				writeTrainingSet(exportPath, style, makeTrainingSet(style));
				std::cout << "Training set written to " << exportPath << std::endl;
			}
		}

		if (imagePath.empty()) {
			if (!haveStyle) {
				parser.printMessage();
				return 1;
			}
			return 0;
		}

		ColorAnalysis analysis = analyzeImage(loadImage(imagePath), config);
		WeightVector weights = haveStyle ? style.weights : uniformWeights();
		printAnalysis(analysis, featuresOf(analysis, weights));

		if (haveStyle) {
			if (style.positives.empty()) {
				std::cerr << "No positive example could be analyzed; skipping the gap report." << std::endl;
				return 1;
			}
			printGapReport(evaluateAgainstStyle(analysis, style, config));
		}
	}
	catch (const std::exception& e) {
		std::cerr << "Error: " << e.what() << std::endl;
		return 1;
	}

	return 0;
}
