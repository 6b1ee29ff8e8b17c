#include "diagnostics.hpp"
#include <opencv2/core/utils/logger.hpp>

const char* warningName(WarningCode code)
{
	switch (code) {
	case WARN_IMAGE_TOO_SMALL:
		return "ImageTooSmall";
	case WARN_INSUFFICIENT_SAMPLES:
		return "InsufficientSamples";
	case WARN_DEGENERATE_WEIGHTS:
		return "DegenerateWeights";
	}
	return "Unknown";
}

// Log the warning, then record it for the caller
void reportWarning(Diagnostics* diagnostics, WarningCode code, const std::string& message)
{
	CV_LOG_WARNING(NULL, warningName(code) << ": " << message);
	if (diagnostics) diagnostics->push_back(Diagnostic{ code, message });
}

bool hasWarning(const Diagnostics& diagnostics, WarningCode code)
{
	for (const Diagnostic& d : diagnostics) {
		if (d.code == code) return true;
	}
	return false;
}
