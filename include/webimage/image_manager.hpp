/**
 * BrlsWebImage - Image Manager interface
 * The fetch/cache collaborator the core issues loads against
 */

#pragma once

#include "webimage/errors.hpp"
#include "webimage/image.hpp"
#include "webimage/options.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace webimage {

// One in-flight load. Cancelling is a hint: a load that already finished may
// still deliver its completion.
class ImageOperation {
public:
    virtual ~ImageOperation() = default;
    virtual void cancel() = 0;
    virtual bool isCancelled() const = 0;
};

using ImageOperationPtr = std::shared_ptr<ImageOperation>;

// (receivedSize, expectedSize, url), called on the fetch thread
using ImageProgressCallback = std::function<void(int64_t, int64_t, const std::string&)>;

// (image, data, error, cacheType, finished, imageUrl). Progressive loads call it
// several times; only the last call has finished == true.
using ImageCompletionCallback = std::function<void(const ImagePtr&, const ImageDataPtr&, const ImageError&,
                                                   CacheType, bool, const std::string&)>;

// Fast tier of the manager's cache
class ImageCachePeek {
public:
    virtual ~ImageCachePeek() = default;

    // True when a secondary weak memory layer is refreshed by memory lookups
    virtual bool shouldUseWeakMemoryCache() const = 0;

    // Non-blocking memory lookup
    virtual ImagePtr imageFromMemoryCache(const std::string& key) = 0;
};

class ImageManager {
public:
    virtual ~ImageManager() = default;

    virtual ImageOperationPtr loadImage(const std::string& url, WebImageOptions options,
                                        const ImageContext& context,
                                        ImageProgressCallback progress,
                                        ImageCompletionCallback completed) = 0;

    virtual std::string cacheKeyForUrl(const std::string& url, const ImageContext& context) const {
        (void)context;
        return url;
    }

    // Null when the manager has no peekable memory tier
    virtual ImageCachePeek* imageCache() { return nullptr; }
};

using ImageManagerPtr = std::shared_ptr<ImageManager>;

} // namespace webimage
