/**
 * BrlsWebImage - Load Options
 * Composable flags controlling how a request is issued and applied
 */

#pragma once

#include <cstdint>

namespace webimage {

enum class WebImageOptions : uint32_t {
    NONE = 0,
    AVOID_AUTO_CANCEL_PREVIOUS = 1 << 0,  // Keep the previous load at the same key running
    DELAY_PLACEHOLDER = 1 << 1,           // Show the placeholder only after the load fails
    AVOID_AUTO_APPLY_RESULT = 1 << 2,     // Never touch the owner, only call the completion
    FORCE_TRANSITION = 1 << 3,            // Use the owner's transition regardless of cache tier
    WAIT_FOR_TRANSITION = 1 << 4,         // Call the completion after the transition completes
    QUERY_MEMORY_DATA_SYNC = 1 << 5,
    QUERY_DISK_DATA_SYNC = 1 << 6
};

inline WebImageOptions operator|(WebImageOptions a, WebImageOptions b) {
    return static_cast<WebImageOptions>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

inline WebImageOptions operator&(WebImageOptions a, WebImageOptions b) {
    return static_cast<WebImageOptions>(static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}

inline WebImageOptions& operator|=(WebImageOptions& a, WebImageOptions b) {
    a = a | b;
    return a;
}

inline bool hasOption(WebImageOptions options, WebImageOptions flag) {
    return (options & flag) == flag && flag != WebImageOptions::NONE;
}

} // namespace webimage
