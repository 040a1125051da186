/**
 * BrlsWebImage - Async utilities
 * Background task execution off the UI thread
 */

#pragma once

#include <functional>
#include <thread>

namespace webimage {

/**
 * Execute a task asynchronously without a callback. The task must not touch
 * views; results go back through a CallbackQueue.
 *
 * @param task The task to run in background
 */
inline void asyncRun(std::function<void()> task) {
    std::thread([task]() {
        task();
    }).detach();
}

} // namespace webimage
