#pragma once
#include <stdexcept>
#include <string>
#include <vector>

// Recoverable conditions raised while analyzing an image or learning weights.
// They never stop a computation; the caller gets a best-effort result plus a record of what happened.
// - WARN_IMAGE_TOO_SMALL: the source image is below the configured minimum dimension
// - WARN_INSUFFICIENT_SAMPLES: fewer distinct colors than requested clusters, k was clamped
// - WARN_DEGENERATE_WEIGHTS: weight learning produced no positive coefficient, uniform weights were used
enum WarningCode { WARN_IMAGE_TOO_SMALL = 0, WARN_INSUFFICIENT_SAMPLES = 1, WARN_DEGENERATE_WEIGHTS = 2 };

struct Diagnostic {
	WarningCode code;
	std::string message;
};

typedef std::vector<Diagnostic> Diagnostics;

// Log a warning through the OpenCV logger and, if `diagnostics` is not null, append it to the list
void reportWarning(Diagnostics* diagnostics, WarningCode code, const std::string& message);

// Short name of a warning code ("ImageTooSmall", ...)
const char* warningName(WarningCode code);

// True if `diagnostics` holds at least one entry with the given code
bool hasWarning(const Diagnostics& diagnostics, WarningCode code);

// Thrown when a computation needs at least one palette entry and gets none.
// Fatal to that single computation only; batch callers catch it per image.
class EmptyPaletteError : public std::invalid_argument {
public:
	explicit EmptyPaletteError(const std::string& what) : std::invalid_argument(what) {}
};
