/**
 * BrlsWebImage - Image Grid implementation
 */

#include "view/image_grid.hpp"

namespace webimage {

ImageGrid::ImageGrid() {
    this->setScrollingBehavior(brls::ScrollingBehavior::CENTERED);

    // Content box to hold all rows
    m_contentBox = new brls::Box();
    m_contentBox->setAxis(brls::Axis::COLUMN);
    m_contentBox->setPadding(10);
    this->setContentView(m_contentBox);

    // PS Vita screen: 960x544, five 150px cells per row
    m_columns = 5;
}

void ImageGrid::setDataSource(const std::vector<GalleryItem>& items) {
    m_items = items;
    rebuildGrid();
}

void ImageGrid::setOnItemSelected(std::function<void(const GalleryItem&)> callback) {
    m_onItemSelected = callback;
}

void ImageGrid::reload() {
    brls::Logger::info("ImageGrid: Reloading {} images", m_cells.size());
    for (size_t i = 0; i < m_cells.size() && i < m_items.size(); i++) {
        m_cells[i]->setItem(m_items[i]);
    }
}

void ImageGrid::rebuildGrid() {
    // Destroyed cells detach from the loader themselves
    m_cells.clear();
    m_contentBox->clearViews();

    if (m_items.empty()) return;

    brls::Box* currentRow = nullptr;
    int itemsInRow = 0;

    for (size_t i = 0; i < m_items.size(); i++) {
        if (itemsInRow == 0) {
            currentRow = new brls::Box();
            currentRow->setAxis(brls::Axis::ROW);
            currentRow->setJustifyContent(brls::JustifyContent::FLEX_START);
            currentRow->setMarginBottom(10);
            m_contentBox->addView(currentRow);
        }

        auto* cell = new ImageCell();
        cell->setWidth(150);
        cell->setHeight(180);
        cell->setMarginRight(10);

        int index = (int)i;
        cell->registerClickAction([this, index](brls::View* view) {
            onItemClicked(index);
            return true;
        });
        cell->addGestureRecognizer(new brls::TapGestureRecognizer(cell));

        currentRow->addView(cell);
        m_cells.push_back(cell);
        cell->setItem(m_items[i]);

        itemsInRow++;
        if (itemsInRow >= m_columns) {
            itemsInRow = 0;
        }
    }
}

void ImageGrid::onItemClicked(int index) {
    if (index >= 0 && index < (int)m_items.size() && m_onItemSelected) {
        m_onItemSelected(m_items[index]);
    }
}

brls::View* ImageGrid::create() {
    return new ImageGrid();
}

} // namespace webimage
