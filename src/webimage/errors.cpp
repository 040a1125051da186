/**
 * BrlsWebImage - Image Load Errors implementation
 */

#include "webimage/errors.hpp"

namespace webimage {

ImageError ImageError::make(ImageErrorCode code, const std::string& message) {
    ImageError error;
    error.code = code;
    error.message = message;
    return error;
}

std::string imageErrorCodeString(ImageErrorCode code) {
    switch (code) {
        case ImageErrorCode::NONE: return "None";
        case ImageErrorCode::INVALID_URL: return "Invalid URL";
        case ImageErrorCode::FETCH_FAILED: return "Fetch failed";
        case ImageErrorCode::BAD_IMAGE_DATA: return "Bad image data";
        default: return "Unknown";
    }
}

} // namespace webimage
