/**
 * BrlsWebImage - Load Indicator interface
 */

#pragma once

#include <memory>

namespace webimage {

// Presentation widget showing that an owner is loading. All calls arrive on
// the callback queue.
class ImageIndicator {
public:
    virtual ~ImageIndicator() = default;

    virtual void startAnimatingIndicator() = 0;
    virtual void stopAnimatingIndicator() = 0;

    // progress is clamped to 0.0 - 1.0
    virtual void updateIndicatorProgress(double progress) { (void)progress; }
};

using ImageIndicatorPtr = std::shared_ptr<ImageIndicator>;

} // namespace webimage
