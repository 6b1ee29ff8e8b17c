#include "config.hpp"
#include <opencv2/core.hpp>
#include <algorithm>
#include <cctype>
#include <stdexcept>

static std::string lowercase(std::string s)
{
	std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)std::tolower(c); });
	return s;
}

// Read an integer option, keeping the default if the key is absent
static void readInt(const cv::FileNode& root, const char* key, int& value)
{
	cv::FileNode node = root[key];
	if (node.empty()) return;
	if (!node.isInt()) throw std::invalid_argument(std::string("config: '") + key + "' must be an integer");
	value = (int)node;
}

static void readDouble(const cv::FileNode& root, const char* key, double& value)
{
	cv::FileNode node = root[key];
	if (node.empty()) return;
	if (!node.isReal() && !node.isInt()) throw std::invalid_argument(std::string("config: '") + key + "' must be a number");
	value = (double)node;
}

// Booleans come back from YAML as strings ("true") or integers (1), depending on how they were written
static void readBool(const cv::FileNode& root, const char* key, bool& value)
{
	cv::FileNode node = root[key];
	if (node.empty()) return;
	if (node.isInt()) {
		value = (int)node != 0;
		return;
	}
	if (node.isString()) {
		std::string s = lowercase((std::string)node);
		if (s == "true" || s == "yes" || s == "on") { value = true; return; }
		if (s == "false" || s == "no" || s == "off") { value = false; return; }
	}
	throw std::invalid_argument(std::string("config: '") + key + "' must be a boolean");
}

void validateConfig(const HarmonyConfig& config)
{
	if (config.k < 1) throw std::invalid_argument("config: k must be >= 1");
	if (config.k_min < 1) throw std::invalid_argument("config: k_min must be >= 1");
	if (config.k_max < config.k_min) throw std::invalid_argument("config: k_max must be >= k_min");
	if (config.kmeans_max_iter < 2 || config.kmeans_max_iter > 100)
		throw std::invalid_argument("config: kmeans_max_iter must be in [2, 100]");
	if (config.kmeans_epsilon < 0.0) throw std::invalid_argument("config: kmeans_epsilon must be >= 0");
	if (config.sample_cap < 0) throw std::invalid_argument("config: sample_cap must be >= 0");
	if (config.resize_width < 1 || config.resize_height < 1)
		throw std::invalid_argument("config: resize_width and resize_height must be >= 1");
	if (config.min_dimension < 0) throw std::invalid_argument("config: min_dimension must be >= 0");
	if (config.negligibility_threshold < 0.0 || config.negligibility_threshold >= 1.0)
		throw std::invalid_argument("config: negligibility_threshold must be in [0, 1)");
	if (config.achromatic_saturation < 0.0 || config.achromatic_saturation > 255.0
		|| config.achromatic_value < 0.0 || config.achromatic_value > 255.0)
		throw std::invalid_argument("config: achromatic_saturation and achromatic_value must be in [0, 255]");
	if (config.suggestion_count < 0) throw std::invalid_argument("config: suggestion_count must be >= 0");
}

HarmonyConfig loadHarmonyConfig(const std::string& path)
{
	cv::FileStorage fs(path, cv::FileStorage::READ);
	if (!fs.isOpened()) throw std::invalid_argument("config: cannot open '" + path + "'");

	HarmonyConfig config;
	cv::FileNode root = fs.root();

	// k is either a cluster count or "auto"
	cv::FileNode k = root["k"];
	if (!k.empty()) {
		if (k.isString() && lowercase((std::string)k) == "auto") {
			config.auto_k = true;
		}
		else if (k.isInt()) {
			config.k = (int)k;
			config.auto_k = false;
		}
		else {
			throw std::invalid_argument("config: 'k' must be an integer or \"auto\"");
		}
	}

	readInt(root, "k_min", config.k_min);
	readInt(root, "k_max", config.k_max);
	readInt(root, "kmeans_max_iter", config.kmeans_max_iter);
	readDouble(root, "kmeans_epsilon", config.kmeans_epsilon);
	readInt(root, "sample_cap", config.sample_cap);
	readInt(root, "resize_width", config.resize_width);
	readInt(root, "resize_height", config.resize_height);
	readBool(root, "keep_aspect", config.keep_aspect);
	readBool(root, "allow_upscale", config.allow_upscale);
	readInt(root, "min_dimension", config.min_dimension);
	readBool(root, "auto_weight_learning", config.auto_weight_learning);
	readDouble(root, "negligibility_threshold", config.negligibility_threshold);
	readDouble(root, "achromatic_saturation", config.achromatic_saturation);
	readDouble(root, "achromatic_value", config.achromatic_value);
	readInt(root, "suggestion_count", config.suggestion_count);

	int seed = (int)config.seed;
	readInt(root, "seed", seed);
	config.seed = (unsigned int)seed;

	validateConfig(config);
	return config;
}
