#include "image_io.hpp"
#include <opencv2/imgcodecs.hpp>
#include <algorithm>
#include <cctype>
#include <stdexcept>

const std::vector<std::string> kSupportedExtensions = { ".jpg", ".jpeg", ".png", ".bmp", ".webp" };

bool isSupportedImage(const std::string& filename)
{
	size_t dot = filename.find_last_of('.');
	if (dot == std::string::npos) return false;

	std::string ext = filename.substr(dot);
	std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return (char)std::tolower(c); });
	return std::find(kSupportedExtensions.begin(), kSupportedExtensions.end(), ext) != kSupportedExtensions.end();
}

std::vector<std::string> listImages(const std::string& folder)
{
	std::vector<cv::String> files;
	cv::glob(folder + "/*", files, false); // not recursive

	std::vector<std::string> images;
	for (const cv::String& f : files) {
		if (isSupportedImage(f)) images.push_back(f);
	}
	std::sort(images.begin(), images.end());
	return images;
}

cv::Mat loadImage(const std::string& path)
{
	cv::Mat image = cv::imread(path, cv::IMREAD_COLOR);
	if (image.empty()) throw std::invalid_argument("cannot read image '" + path + "'");
	return image;
}
