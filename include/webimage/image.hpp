/**
 * BrlsWebImage - Image types
 * Images, owner references and per-request context shared by the core
 */

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <vector>

namespace webimage {

class CallbackQueue;
class ImageManager;

using ImageData = std::vector<uint8_t>;
using ImageDataPtr = std::shared_ptr<const ImageData>;

// Encoded image bytes ready to hand to a view. Decoding is left to the view
// (brls::Image decodes in setImageFromMem).
class Image {
public:
    explicit Image(ImageData bytes);

    static std::shared_ptr<Image> fromData(const ImageDataPtr& data);

    const uint8_t* bytes() const { return m_bytes.data(); }
    size_t size() const { return m_bytes.size(); }
    bool empty() const { return m_bytes.empty(); }

private:
    ImageData m_bytes;
};

using ImagePtr = std::shared_ptr<const Image>;

// Where the manager found the image
enum class CacheType {
    NONE = 0,  // Downloaded from the network
    DISK,
    MEMORY,
    ALL
};

std::string cacheTypeString(CacheType type);

// Identity of an object images are loaded into. The core never dereferences
// the address; it is only a side-table key.
struct OwnerRef {
    const void* id = nullptr;
    std::type_index type = std::type_index(typeid(void));

    template <typename T>
    static OwnerRef of(const T* owner) {
        OwnerRef ref;
        ref.id = owner;
        if (owner) ref.type = std::type_index(typeid(*owner));
        return ref;
    }

    bool valid() const { return id != nullptr; }
};

// Per-request configuration forwarded down to the manager
struct ImageContext {
    std::string operationKey;                      // Empty: derive from the owner type
    std::shared_ptr<CallbackQueue> callbackQueue;  // Null: main thread queue
    std::shared_ptr<ImageManager> customManager;   // Null: default manager
};

} // namespace webimage
