/**
 * BrlsWebImage - Image Load Errors
 */

#pragma once

#include <string>

namespace webimage {

enum class ImageErrorCode {
    NONE = 0,
    INVALID_URL,     // No target to load, synthesized locally
    FETCH_FAILED,    // Reported by the manager
    BAD_IMAGE_DATA   // Manager got bytes it could not turn into an image
};

struct ImageError {
    ImageErrorCode code = ImageErrorCode::NONE;
    std::string message;

    bool isError() const { return code != ImageErrorCode::NONE; }

    static ImageError none() { return ImageError(); }
    static ImageError make(ImageErrorCode code, const std::string& message);
};

std::string imageErrorCodeString(ImageErrorCode code);

} // namespace webimage
