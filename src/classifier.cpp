#include "classifier.hpp"
#include <stdexcept>

cv::Mat featureRow(const FeatureVector& features)
{
	cv::Mat row(1, FEATURE_COUNT, CV_32F);
	for (int i = 0; i < FEATURE_COUNT; ++i) row.at<float>(0, i) = (float)features[i];
	return row;
}

TrainingSet makeTrainingSet(const StyleProfile& style)
{
	int n = (int)(style.positives.size() + style.negatives.size());

	TrainingSet data;
	data.samples = cv::Mat(n, FEATURE_COUNT, CV_32F);
	data.labels = cv::Mat(n, 1, CV_32S);

	int row = 0;
	for (const FeatureVector& f : style.positives) {
		featureRow(f).copyTo(data.samples.row(row));
		data.labels.at<int>(row++) = 1;
	}
	for (const FeatureVector& f : style.negatives) {
		featureRow(f).copyTo(data.samples.row(row));
		data.labels.at<int>(row++) = 0;
	}
	return data;
}

void writeTrainingSet(const std::string& path, const StyleProfile& style, const TrainingSet& data)
{
	cv::FileStorage fs(path, cv::FileStorage::WRITE);
	if (!fs.isOpened()) throw std::invalid_argument("cannot open '" + path + "' for writing");

	fs << "style" << style.name;
	fs << "fields" << "[";
	for (int i = 0; i < FEATURE_COUNT; ++i) fs << featureFieldName((FeatureField)i);
	fs << "]";
	fs << "weights" << cv::Mat(style.weights, true).reshape(1, 1);
	fs << "samples" << data.samples;
	fs << "labels" << data.labels;
}
