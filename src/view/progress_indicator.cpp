/**
 * BrlsWebImage - Progress Indicator implementation
 */

#include "view/progress_indicator.hpp"

namespace webimage {

ProgressIndicator::ProgressIndicator(brls::Rectangle* bar, float width) : m_bar(bar), m_width(width) {}

void ProgressIndicator::startAnimatingIndicator() {
    m_animating = true;
    m_progress = 0;
    if (m_bar) {
        m_bar->setWidth(0);
        m_bar->setVisibility(brls::Visibility::VISIBLE);
    }
}

void ProgressIndicator::stopAnimatingIndicator() {
    m_animating = false;
    if (m_bar) {
        m_bar->setVisibility(brls::Visibility::GONE);
    }
}

void ProgressIndicator::updateIndicatorProgress(double progress) {
    if (progress < 0) progress = 0;
    if (progress > 1) progress = 1;
    m_progress = progress;

    if (m_bar && m_animating) {
        m_bar->setWidth(m_width * (float)progress);
    }
}

} // namespace webimage
