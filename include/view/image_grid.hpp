/**
 * BrlsWebImage - Image Grid
 * Scrolling grid of image cells
 */

#pragma once

#include "view/image_cell.hpp"

#include <borealis.hpp>
#include <functional>
#include <vector>

namespace webimage {

class ImageGrid : public brls::ScrollingFrame {
public:
    ImageGrid();

    void setDataSource(const std::vector<GalleryItem>& items);
    void setOnItemSelected(std::function<void(const GalleryItem&)> callback);

    // Loads every cell again
    void reload();

    size_t getItemCount() const { return m_items.size(); }

    static brls::View* create();

private:
    void rebuildGrid();
    void onItemClicked(int index);

    std::vector<GalleryItem> m_items;
    std::vector<ImageCell*> m_cells;
    std::function<void(const GalleryItem&)> m_onItemSelected;

    brls::Box* m_contentBox = nullptr;
    int m_columns = 5;
};

} // namespace webimage
