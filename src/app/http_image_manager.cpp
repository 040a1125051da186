/**
 * BrlsWebImage - HTTP Image Manager implementation
 */

#include "app/http_image_manager.hpp"
#include "utils/async.hpp"
#include "utils/http_client.hpp"

#include <borealis.hpp>

namespace webimage {

bool MemoryImageCache::find(const std::string& key, Entry& entry) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(key);
    if (it == m_entries.end()) return false;
    entry = it->second;
    return true;
}

void MemoryImageCache::store(const std::string& key, const Entry& entry) {
    std::lock_guard<std::mutex> lock(m_mutex);
    // Keep low to preserve memory on the Vita (256MB total)
    if (m_entries.size() >= m_limit) {
        m_entries.clear();
    }
    m_entries[key] = entry;
}

void MemoryImageCache::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.clear();
}

size_t MemoryImageCache::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

void MemoryImageCache::setLimit(size_t limit) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_limit = limit > 0 ? limit : 1;
    if (m_entries.size() > m_limit) {
        m_entries.clear();
    }
}

HttpImageManager::HttpImageManager(size_t memoryCacheLimit, int timeoutSeconds)
    : m_cache(std::make_shared<MemoryImageCache>(memoryCacheLimit > 0 ? memoryCacheLimit : 1)),
      m_timeout(timeoutSeconds) {}

ImagePtr HttpImageManager::imageFromMemoryCache(const std::string& key) {
    MemoryImageCache::Entry entry;
    if (!m_cache->find(key, entry)) return nullptr;
    return entry.image;
}

ImageOperationPtr HttpImageManager::loadImage(const std::string& url, WebImageOptions options,
                                              const ImageContext& context, ImageProgressCallback progress,
                                              ImageCompletionCallback completed) {
    (void)options;
    auto operation = std::make_shared<HttpImageOperation>();
    std::string key = cacheKeyForUrl(url, context);

    // Memory hits complete right away on the calling thread
    MemoryImageCache::Entry entry;
    if (m_cache->find(key, entry)) {
        brls::Logger::debug("HttpImageManager: Memory hit for {}", url);
        if (completed) completed(entry.image, entry.data, ImageError::none(), CacheType::MEMORY, true, url);
        return operation;
    }

    std::shared_ptr<MemoryImageCache> cache = m_cache;
    int timeout = m_timeout;

    asyncRun([url, key, cache, timeout, operation, progress, completed]() {
        if (operation->isCancelled()) return;

        auto buffer = std::make_shared<ImageData>();
        int64_t expected = 0;

        HttpClient client;
        client.setTimeout(timeout);
        HttpResponse response = client.download(
            url,
            [&](const char* data, size_t size) {
                if (operation->isCancelled()) return false;
                buffer->insert(buffer->end(), (const uint8_t*)data, (const uint8_t*)data + size);
                if (progress) progress((int64_t)buffer->size(), expected, url);
                return true;
            },
            [&](int64_t totalSize) {
                expected = totalSize;
                if (progress) progress(0, expected, url);
            });

        // Cancelled loads are never reported
        if (response.cancelled || operation->isCancelled()) return;
        if (!completed) return;

        if (!response.success) {
            completed(nullptr, nullptr, ImageError::make(ImageErrorCode::FETCH_FAILED, response.error),
                      CacheType::NONE, true, url);
            return;
        }

        ImageDataPtr data = buffer;
        ImagePtr image = Image::fromData(data);
        if (!image) {
            completed(nullptr, nullptr, ImageError::make(ImageErrorCode::BAD_IMAGE_DATA, "Empty response body"),
                      CacheType::NONE, true, url);
            return;
        }

        MemoryImageCache::Entry fresh;
        fresh.image = image;
        fresh.data = data;
        cache->store(key, fresh);

        completed(image, data, ImageError::none(), CacheType::NONE, true, url);
    });

    return operation;
}

} // namespace webimage
