/**
 * BrlsWebImage - Progress Bridge implementation
 */

#include "webimage/progress_bridge.hpp"

#include <utility>

namespace webimage {

ProgressBridge::ProgressBridge(ProgressPtr progress, ImageIndicatorPtr indicator,
                               std::shared_ptr<CallbackQueue> queue, SupersessionToken token,
                               ImageProgressCallback observer)
    : m_progress(std::move(progress)),
      m_indicator(std::move(indicator)),
      m_queue(std::move(queue)),
      m_token(std::move(token)),
      m_observer(std::move(observer)) {}

double ProgressBridge::normalize(int64_t receivedSize, int64_t expectedSize) {
    double progress = 0;
    if (expectedSize != 0) {
        progress = (double)receivedSize / (double)expectedSize;
    }
    if (progress < 0) progress = 0;
    if (progress > 1) progress = 1;
    return progress;
}

void ProgressBridge::onProgress(int64_t receivedSize, int64_t expectedSize, const std::string& url) const {
    // A newer request on the slot owns the counters now
    if (m_progress && m_progress->isOwnedBy(m_token.generation())) {
        m_progress->setTotalUnitCount(expectedSize);
        m_progress->setCompletedUnitCount(receivedSize);
    }

    if (m_indicator && m_queue) {
        double progress = normalize(receivedSize, expectedSize);
        ImageIndicatorPtr indicator = m_indicator;
        SupersessionToken token = m_token;
        m_queue->async([indicator, token, progress]() {
            if (!token.isCurrent()) return;
            indicator->updateIndicatorProgress(progress);
        });
    }

    // Observers run on the fetch thread
    if (m_observer) {
        m_observer(receivedSize, expectedSize, url);
    }
}

ImageProgressCallback ProgressBridge::asCallback() const {
    ProgressBridge bridge = *this;
    return [bridge](int64_t receivedSize, int64_t expectedSize, const std::string& url) {
        bridge.onProgress(receivedSize, expectedSize, url);
    };
}

} // namespace webimage
