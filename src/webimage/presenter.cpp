/**
 * BrlsWebImage - Image Presenters implementation
 */

#include "webimage/presenter.hpp"

#include <utility>
#include <vector>

namespace webimage {

CallbackPresenter::CallbackPresenter(SetImageCallback callback) : m_callback(std::move(callback)) {}

void CallbackPresenter::setImage(const ImagePtr& image, const ImageDataPtr& data, CacheType cacheType,
                                 const std::string& imageUrl) {
    if (m_callback) m_callback(image, data, cacheType, imageUrl);
}

ImageViewPresenter::ImageViewPresenter(brls::Image* view) : m_view(view) {}

void ImageViewPresenter::setImage(const ImagePtr& image, const ImageDataPtr& data, CacheType cacheType,
                                  const std::string& imageUrl) {
    (void)data;
    (void)cacheType;
    if (!m_view) return;

    if (!image || image->empty()) {
        m_view->clear();
        return;
    }

    // setImageFromMem takes a mutable buffer
    std::vector<uint8_t> bytes(image->bytes(), image->bytes() + image->size());
    m_view->setImageFromMem(bytes.data(), (int)bytes.size());
    brls::Logger::debug("ImageViewPresenter: Set {} bytes from {}", bytes.size(),
                        imageUrl.empty() ? "(placeholder)" : imageUrl);
}

} // namespace webimage
