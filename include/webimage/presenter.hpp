/**
 * BrlsWebImage - Image Presenters
 * How a loaded image ends up on its owner
 *
 * The presenter is picked once per request from what the owner is (a plain
 * brls::Image, one state of a multi-state control, or a caller-supplied
 * setter), so the load algorithm never inspects owner types.
 */

#pragma once

#include "webimage/image.hpp"

#include <borealis.hpp>
#include <functional>
#include <memory>
#include <string>

namespace webimage {

// (image, data, cacheType, imageUrl)
using SetImageCallback = std::function<void(const ImagePtr&, const ImageDataPtr&, CacheType, const std::string&)>;

class ImagePresenter {
public:
    virtual ~ImagePresenter() = default;

    // Called on the callback queue. A null image clears the owner.
    virtual void setImage(const ImagePtr& image, const ImageDataPtr& data, CacheType cacheType,
                          const std::string& imageUrl) = 0;
};

using ImagePresenterPtr = std::shared_ptr<ImagePresenter>;

class CallbackPresenter : public ImagePresenter {
public:
    explicit CallbackPresenter(SetImageCallback callback);

    void setImage(const ImagePtr& image, const ImageDataPtr& data, CacheType cacheType,
                  const std::string& imageUrl) override;

private:
    SetImageCallback m_callback;
};

/**
 * Sets the bytes on a brls::Image. The view must outlive the presenter's use;
 * ImageLoader guarantees it by dropping every pending step when the owner
 * detaches.
 */
class ImageViewPresenter : public ImagePresenter {
public:
    explicit ImageViewPresenter(brls::Image* view);

    void setImage(const ImagePtr& image, const ImageDataPtr& data, CacheType cacheType,
                  const std::string& imageUrl) override;

private:
    brls::Image* m_view = nullptr;
};

} // namespace webimage
