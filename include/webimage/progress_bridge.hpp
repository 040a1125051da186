/**
 * BrlsWebImage - Progress Bridge
 * Turns raw byte counts from the fetch thread into Progress updates,
 * indicator updates and caller progress callbacks
 */

#pragma once

#include "webimage/callback_queue.hpp"
#include "webimage/image_manager.hpp"
#include "webimage/indicator.hpp"
#include "webimage/load_state.hpp"
#include "webimage/supersession.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace webimage {

class ProgressBridge {
public:
    ProgressBridge(ProgressPtr progress, ImageIndicatorPtr indicator,
                   std::shared_ptr<CallbackQueue> queue, SupersessionToken token,
                   ImageProgressCallback observer);

    // Called on the fetch thread. The Progress counters and the observer are
    // updated inline, the indicator through the callback queue. Counters are
    // only written while the Progress is still claimed by this request.
    void onProgress(int64_t receivedSize, int64_t expectedSize, const std::string& url) const;

    // Callable handed to the manager
    ImageProgressCallback asCallback() const;

    // received / expected clamped to 0.0 - 1.0, 0 when expected is 0
    static double normalize(int64_t receivedSize, int64_t expectedSize);

private:
    ProgressPtr m_progress;
    ImageIndicatorPtr m_indicator;
    std::shared_ptr<CallbackQueue> m_queue;
    SupersessionToken m_token;
    ImageProgressCallback m_observer;
};

} // namespace webimage
