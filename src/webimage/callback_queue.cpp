/**
 * BrlsWebImage - Callback Queue implementation
 */

#include "webimage/callback_queue.hpp"

#include <borealis.hpp>
#include <utility>

namespace webimage {

static std::shared_ptr<CallbackQueue> s_mainQueue;

std::shared_ptr<CallbackQueue> CallbackQueue::mainQueue() {
    if (!s_mainQueue) {
        s_mainQueue = std::make_shared<MainThreadQueue>();
    }
    return s_mainQueue;
}

void CallbackQueue::setMainQueue(std::shared_ptr<CallbackQueue> queue) {
    s_mainQueue = std::move(queue);
}

void MainThreadQueue::async(std::function<void()> task) {
    if (!task) return;
    brls::sync(std::move(task));
}

} // namespace webimage
