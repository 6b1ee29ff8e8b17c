#pragma once
#include <opencv2/core.hpp>
#include <string>
#include <vector>

// File extensions accepted as images (lower case, with the dot)
extern const std::vector<std::string> kSupportedExtensions;

// True if the file name ends with a supported extension (case-insensitive)
bool isSupportedImage(const std::string& filename);

// Sorted list of the supported images directly inside `folder`
std::vector<std::string> listImages(const std::string& folder);

// Decode an image file as 8-bit BGR
//
// Throws:
//   std::invalid_argument if the file cannot be read or decoded
cv::Mat loadImage(const std::string& path);
