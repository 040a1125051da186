/**
 * BrlsWebImage - Progress Indicator
 * Load indicator drawn as a thin bar under an image
 */

#pragma once

#include "webimage/indicator.hpp"

#include <borealis.hpp>

namespace webimage {

class ProgressIndicator : public ImageIndicator {
public:
    // bar is owned by the view tree, width is the bar's full width
    ProgressIndicator(brls::Rectangle* bar, float width);

    void startAnimatingIndicator() override;
    void stopAnimatingIndicator() override;
    void updateIndicatorProgress(double progress) override;

    bool isAnimating() const { return m_animating; }
    double getProgress() const { return m_progress; }

private:
    brls::Rectangle* m_bar = nullptr;
    float m_width = 0;
    bool m_animating = false;
    double m_progress = 0;
};

} // namespace webimage
