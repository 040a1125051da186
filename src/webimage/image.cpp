/**
 * BrlsWebImage - Image types implementation
 */

#include "webimage/image.hpp"

#include <utility>

namespace webimage {

Image::Image(ImageData bytes) : m_bytes(std::move(bytes)) {}

std::shared_ptr<Image> Image::fromData(const ImageDataPtr& data) {
    if (!data || data->empty()) return nullptr;
    return std::make_shared<Image>(*data);
}

std::string cacheTypeString(CacheType type) {
    switch (type) {
        case CacheType::NONE: return "none";
        case CacheType::DISK: return "disk";
        case CacheType::MEMORY: return "memory";
        case CacheType::ALL: return "all";
        default: return "unknown";
    }
}

} // namespace webimage
