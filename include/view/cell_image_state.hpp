/**
 * BrlsWebImage - Cell Image State
 * Which image an ImageCell shows, and whether a fade is holding it hidden
 */

#pragma once

#include "webimage/image.hpp"
#include "webimage/operation_key.hpp"

namespace webimage {

class CellImageState {
public:
    // Stores the image for state and reveals the cell. A new image always
    // ends up visible, even when a fade that hid the cell was abandoned.
    void setImage(ControlState state, const ImagePtr& image);
    ImagePtr getImage(ControlState state) const;

    void setFocused(bool focused) { m_focused = focused; }
    bool isFocused() const { return m_focused; }

    // Focused image while focused and loaded, the normal one otherwise
    ImagePtr visibleImage() const;

    void hide() { m_hidden = true; }
    void reveal() { m_hidden = false; }
    bool isHidden() const { return m_hidden; }

    // Drops both images and reveals
    void clear();

private:
    ImagePtr m_normalImage;
    ImagePtr m_focusedImage;
    bool m_focused = false;
    bool m_hidden = false;
};

} // namespace webimage
