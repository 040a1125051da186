/**
 * BrlsWebImage - Callback Queue
 * Serialized FIFO dispatcher all presentation work is submitted to
 */

#pragma once

#include <functional>
#include <memory>

namespace webimage {

class CallbackQueue {
public:
    virtual ~CallbackQueue() = default;

    // Run the task later, after every task submitted before it
    virtual void async(std::function<void()> task) = 0;

    // Queue used when a request does not name one
    static std::shared_ptr<CallbackQueue> mainQueue();
    static void setMainQueue(std::shared_ptr<CallbackQueue> queue);
};

/**
 * Dispatches onto the borealis main loop with brls::sync
 */
class MainThreadQueue : public CallbackQueue {
public:
    void async(std::function<void()> task) override;
};

} // namespace webimage
