/**
 * BrlsWebImage - HTTP Image Manager
 * Downloads images with libcurl and keeps recent ones in memory
 */

#pragma once

#include "webimage/image_manager.hpp"

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace webimage {

class HttpImageOperation : public ImageOperation {
public:
    void cancel() override { m_cancelled.store(true); }
    bool isCancelled() const override { return m_cancelled.load(); }

private:
    std::atomic<bool> m_cancelled{false};
};

/**
 * Size-capped memory tier. Shared with download workers, which may outlive
 * the manager.
 */
class MemoryImageCache {
public:
    explicit MemoryImageCache(size_t limit) : m_limit(limit) {}

    struct Entry {
        ImagePtr image;
        ImageDataPtr data;
    };

    bool find(const std::string& key, Entry& entry) const;
    void store(const std::string& key, const Entry& entry);
    void clear();

    size_t size() const;
    void setLimit(size_t limit);

private:
    mutable std::mutex m_mutex;
    std::map<std::string, Entry> m_entries;
    size_t m_limit;
};

class HttpImageManager : public ImageManager, public ImageCachePeek {
public:
    explicit HttpImageManager(size_t memoryCacheLimit = 30, int timeoutSeconds = 30);

    ImageOperationPtr loadImage(const std::string& url, WebImageOptions options, const ImageContext& context,
                                ImageProgressCallback progress, ImageCompletionCallback completed) override;

    ImageCachePeek* imageCache() override { return this; }

    bool shouldUseWeakMemoryCache() const override { return m_useWeakMemoryCache; }
    ImagePtr imageFromMemoryCache(const std::string& key) override;

    void setUseWeakMemoryCache(bool use) { m_useWeakMemoryCache = use; }
    void setTimeout(int seconds) { m_timeout = seconds; }
    void setMemoryCacheLimit(size_t limit) { m_cache->setLimit(limit); }

    void clearMemoryCache() { m_cache->clear(); }
    size_t memoryCacheSize() const { return m_cache->size(); }

private:
    std::shared_ptr<MemoryImageCache> m_cache;
    int m_timeout;
    bool m_useWeakMemoryCache = true;
};

} // namespace webimage
