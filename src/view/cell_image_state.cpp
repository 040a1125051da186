/**
 * BrlsWebImage - Cell Image State implementation
 */

#include "view/cell_image_state.hpp"

namespace webimage {

void CellImageState::setImage(ControlState state, const ImagePtr& image) {
    if (state == ControlState::FOCUSED) {
        m_focusedImage = image;
    } else {
        m_normalImage = image;
    }
    m_hidden = false;
}

ImagePtr CellImageState::getImage(ControlState state) const {
    return state == ControlState::FOCUSED ? m_focusedImage : m_normalImage;
}

ImagePtr CellImageState::visibleImage() const {
    return (m_focused && m_focusedImage) ? m_focusedImage : m_normalImage;
}

void CellImageState::clear() {
    m_normalImage = nullptr;
    m_focusedImage = nullptr;
    m_hidden = false;
}

} // namespace webimage
