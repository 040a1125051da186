/**
 * BrlsWebImage - Image Cell
 * A grid cell with a normal and a focused image
 */

#pragma once

#include "view/cell_image_state.hpp"
#include "webimage/errors.hpp"
#include "webimage/image.hpp"
#include "webimage/operation_key.hpp"
#include "webimage/presenter.hpp"

#include <borealis.hpp>
#include <string>

namespace webimage {

struct GalleryItem {
    std::string title;
    std::string url;
    std::string focusedUrl;  // Empty: keep showing url when focused
};

class ProgressIndicator;

class ImageCell : public brls::Box {
public:
    ImageCell();
    ~ImageCell() override;

    void setItem(const GalleryItem& item);
    const GalleryItem& getItem() const { return m_item; }

    // Image shown for state; a null image clears the slot
    void setStateImage(ControlState state, const ImagePtr& image);
    ImagePtr getStateImage(ControlState state) const;

    // Drops both images and cancels their loads
    void reset();

    void onFocusGained() override;
    void onFocusLost() override;

    static brls::View* create();

private:
    void loadImages();
    void refreshImage();
    void installTransition();
    void onLoadFinished(ControlState state, const ImageError& error);

    GalleryItem m_item;
    CellImageState m_state;
    ImagePtr m_shownImage;
    unsigned int m_loadCount = 0;  // Bumped per setItem, stale chains check it

    brls::Image* m_image = nullptr;
    brls::Label* m_titleLabel = nullptr;
    brls::Label* m_statusLabel = nullptr;
    brls::Rectangle* m_progressBar = nullptr;
    std::shared_ptr<ProgressIndicator> m_indicator;
};

/**
 * Presents into one state of an ImageCell
 */
class CellStatePresenter : public ImagePresenter {
public:
    CellStatePresenter(ImageCell* cell, ControlState state);

    void setImage(const ImagePtr& image, const ImageDataPtr& data, CacheType cacheType,
                  const std::string& imageUrl) override;

private:
    ImageCell* m_cell;
    ControlState m_state;
};

} // namespace webimage
