#pragma once
#include <opencv2/core.hpp>
#include <string>
#include <vector>
#include "feature_vector.hpp"
#include "harmony_engine.hpp"

// Labeled feature vectors in the layout OpenCV's ml module expects
// - `samples`: one CV_32F row of FEATURE_COUNT columns per image
// - `labels`: CV_32S column, 1 for style-positive and 0 for style-negative
struct TrainingSet {
	cv::Mat samples;
	cv::Mat labels;
};

// Boundary to the supervised classifier that scores style-likeness.
// The engine only produces its inputs; training and inference belong to the implementation.
class StyleClassifier {
public:
	virtual ~StyleClassifier() = default;

	// Fit a model from labeled feature vectors
	virtual void train(const TrainingSet& data) = 0;

	// Probability in [0, 1] that the image belongs to the style
	virtual double score(const FeatureVector& features) const = 0;
};

// One CV_32F row holding the feature vector
cv::Mat featureRow(const FeatureVector& features);

// Stack a style's positive and negative vectors into a TrainingSet (positives first)
TrainingSet makeTrainingSet(const StyleProfile& style);

// Write a training set with cv::FileStorage (format chosen from the extension: .yml, .json, .xml)
//
// Throws:
//   std::invalid_argument if the file cannot be opened for writing
void writeTrainingSet(const std::string& path, const StyleProfile& style, const TrainingSet& data);
