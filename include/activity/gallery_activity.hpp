/**
 * BrlsWebImage - Gallery Activity
 * Image grid with a large preview of the selected image
 */

#pragma once

#include "view/image_cell.hpp"

#include <borealis.hpp>
#include <vector>

namespace webimage {

class ImageGrid;

class GalleryActivity : public brls::Activity {
public:
    GalleryActivity();
    ~GalleryActivity() override;

    brls::View* createContentView() override;

    void onContentAvailable() override;

    // Items for the configured urls, or the built-in sample set
    static std::vector<GalleryItem> buildItems(const std::string& urlList);

private:
    void showPreview(const GalleryItem& item);
    void cancelPreview();

    ImageGrid* m_grid = nullptr;
    brls::Image* m_preview = nullptr;
    brls::Label* m_previewLabel = nullptr;
};

} // namespace webimage
