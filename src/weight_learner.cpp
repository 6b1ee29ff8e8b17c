#include "weight_learner.hpp"
#include <opencv2/ml.hpp>
#include <opencv2/core/utils/logger.hpp>
#include <sstream>

// Harmony scores live in [0, 1], so plain batch gradient descent with a large step converges quickly
static const double kLearningRate = 1.0;
static const int kIterations = 2000;

bool normalizeCoefficients(const cv::Vec<double, HARMONY_METRIC_COUNT>& coefficients, WeightVector& weights)
{
	WeightVector clipped;
	double sum = 0.0;
	for (int i = 0; i < HARMONY_METRIC_COUNT; ++i) {
		clipped[i] = coefficients[i] > kWeightCoefficientFloor ? coefficients[i] : 0.0;
		sum += clipped[i];
	}
	if (sum <= 0.0) {
		weights = uniformWeights();
		return false;
	}
	for (int i = 0; i < HARMONY_METRIC_COUNT; ++i) weights[i] = clipped[i] / sum;
	return true;
}

// Copy the harmony fields of the vectors into consecutive rows of `data`, labelling them with `label`
static void appendRows(const std::vector<FeatureVector>& vectors, float label, cv::Mat& data, cv::Mat& labels, int& row)
{
	for (const FeatureVector& f : vectors) {
		HarmonyScores scores = harmonyPart(f);
		for (int i = 0; i < HARMONY_METRIC_COUNT; ++i) data.at<float>(row, i) = (float)scores[i];
		labels.at<float>(row, 0) = label;
		++row;
	}
}

WeightLearningResult learnWeights(
	const std::vector<FeatureVector>& positives,
	const std::vector<FeatureVector>& negatives,
	Diagnostics* diagnostics)
{
	WeightLearningResult result;
	result.weights = uniformWeights();
	result.coefficients = cv::Vec<double, HARMONY_METRIC_COUNT>::all(0.0);

	if (positives.empty() || negatives.empty()) {
		std::ostringstream msg;
		msg << "need both positive and negative examples (got " << positives.size() << " and "
			<< negatives.size() << "); using uniform weights";
		reportWarning(diagnostics, WARN_DEGENERATE_WEIGHTS, msg.str());
		result.degenerate = true;
		return result;
	}

	int n = (int)(positives.size() + negatives.size());
	cv::Mat data(n, HARMONY_METRIC_COUNT, CV_32F);
	cv::Mat labels(n, 1, CV_32F); // cv::ml::LogisticRegression wants float labels
	int row = 0;
	appendRows(positives, 1.0f, data, labels, row);
	appendRows(negatives, 0.0f, data, labels, row);

	cv::Ptr<cv::ml::LogisticRegression> lr = cv::ml::LogisticRegression::create();
	lr->setLearningRate(kLearningRate);
	lr->setIterations(kIterations);
	lr->setRegularization(cv::ml::LogisticRegression::REG_DISABLE);
	lr->setTrainMethod(cv::ml::LogisticRegression::BATCH);
	lr->setTermCriteria(cv::TermCriteria(cv::TermCriteria::COUNT, kIterations, 0.0));
	lr->train(data, cv::ml::ROW_SAMPLE, labels);

	// One row for a binary problem: bias first, then one coefficient per harmony field
	cv::Mat thetas;
	lr->get_learnt_thetas().convertTo(thetas, CV_64F);
	thetas = thetas.reshape(1, 1);
	CV_Assert(thetas.cols == HARMONY_METRIC_COUNT + 1);
	for (int i = 0; i < HARMONY_METRIC_COUNT; ++i) result.coefficients[i] = thetas.at<double>(0, i + 1);

	if (!normalizeCoefficients(result.coefficients, result.weights)) {
		std::ostringstream msg;
		msg << "no harmony metric separates positives from negatives (coefficients " << result.coefficients
			<< "); using uniform weights";
		reportWarning(diagnostics, WARN_DEGENERATE_WEIGHTS, msg.str());
		result.degenerate = true;
		return result;
	}

	CV_LOG_INFO(NULL, "learned harmony weights " << result.weights << " from " << positives.size()
		<< " positive and " << negatives.size() << " negative examples");
	return result;
}
