/**
 * BrlsWebImage - Gallery Activity implementation
 */

#include "activity/gallery_activity.hpp"
#include "app/application.hpp"
#include "utils/image_loader.hpp"
#include "view/image_grid.hpp"

#include <cstdio>
#include <memory>

namespace webimage {

static const char* SAMPLE_IMAGE_HOST = "https://picsum.photos/id/";
static const int SAMPLE_IMAGE_COUNT = 15;

GalleryActivity::GalleryActivity() {
    brls::Logger::debug("GalleryActivity created");
}

GalleryActivity::~GalleryActivity() {
    if (m_preview) ImageLoader::detach(OwnerRef::of(m_preview));
}

std::vector<GalleryItem> GalleryActivity::buildItems(const std::string& urlList) {
    std::vector<GalleryItem> items;

    std::vector<std::string> urls = splitUrlList(urlList);
    if (!urls.empty()) {
        for (size_t i = 0; i < urls.size(); i++) {
            GalleryItem item;
            item.title = "Image " + std::to_string(i + 1);
            item.url = urls[i];
            items.push_back(item);
        }
        return items;
    }

    for (int i = 0; i < SAMPLE_IMAGE_COUNT; i++) {
        GalleryItem item;
        item.title = "Sample " + std::to_string(i + 1);
        item.url = SAMPLE_IMAGE_HOST + std::to_string(10 + i) + "/300/300";
        // Every third sample swaps to a grayscale version when focused
        if (i % 3 == 0) item.focusedUrl = item.url + "?grayscale";
        items.push_back(item);
    }
    return items;
}

brls::View* GalleryActivity::createContentView() {
    auto* root = new brls::Box();
    root->setAxis(brls::Axis::ROW);
    root->setWidth(brls::View::AUTO);
    root->setHeight(brls::View::AUTO);
    root->setPadding(20);

    m_grid = new ImageGrid();
    m_grid->setGrow(1.0f);
    root->addView(m_grid);

    auto* previewBox = new brls::Box();
    previewBox->setAxis(brls::Axis::COLUMN);
    previewBox->setAlignItems(brls::AlignItems::CENTER);
    previewBox->setWidth(260);
    previewBox->setMarginLeft(15);

    m_preview = new brls::Image();
    m_preview->setWidth(240);
    m_preview->setHeight(240);
    m_preview->setScalingType(brls::ImageScalingType::FIT);
    m_preview->setCornerRadius(6);
    previewBox->addView(m_preview);

    m_previewLabel = new brls::Label();
    m_previewLabel->setFontSize(14);
    m_previewLabel->setMarginTop(10);
    m_previewLabel->setHorizontalAlign(brls::HorizontalAlign::CENTER);
    m_previewLabel->setText("Select an image");
    previewBox->addView(m_previewLabel);

    root->addView(previewBox);
    return root;
}

void GalleryActivity::onContentAvailable() {
    brls::Logger::debug("GalleryActivity content available");

    const AppSettings& settings = Application::getInstance().getSettings();
    std::vector<GalleryItem> items = buildItems(settings.galleryUrls);
    brls::Logger::info("GalleryActivity: Showing {} images", items.size());

    m_grid->setOnItemSelected([this](const GalleryItem& item) {
        showPreview(item);
    });
    m_grid->setDataSource(items);

    this->registerAction("Reload", brls::ControllerButton::BUTTON_X, [this](brls::View* view) {
        m_grid->reload();
        return true;
    });

    this->registerAction("Cancel", brls::ControllerButton::BUTTON_Y, [this](brls::View* view) {
        cancelPreview();
        return true;
    });
}

void GalleryActivity::showPreview(const GalleryItem& item) {
    if (!m_preview) return;

    const AppSettings& settings = Application::getInstance().getSettings();
    OwnerRef owner = OwnerRef::of(m_preview);

    ImageLoader::setImageTransition(
        owner, settings.transitionsEnabled ? ImageTransition::fade(settings.transitionDuration) : nullptr);

    m_previewLabel->setText("Loading...");

    // Progress arrives on the download thread
    brls::Label* label = m_previewLabel;
    ImageProgressCallback progress = [label, owner](int64_t received, int64_t expected, const std::string& url) {
        if (expected <= 0) return;
        int percent = (int)(received * 100 / expected);
        brls::sync([label, owner, url, percent]() {
            // Only the preview's latest url may write the label
            if (ImageLoader::imageUrl(owner) != url) return;
            label->setText(std::to_string(percent) + "%");
        });
    };

    std::string title = item.title;
    ImageCompletionCallback completed = [this, title](const ImagePtr& image, const ImageDataPtr&,
                                                      const ImageError& error, CacheType cacheType, bool finished,
                                                      const std::string&) {
        if (!finished) return;
        if (error.isError() || !image) {
            m_previewLabel->setText(title + ": " + (error.message.empty() ? "failed" : error.message));
            return;
        }
        char info[64];
        snprintf(info, sizeof(info), "%.1f KB (%s)", (double)image->size() / 1024.0,
                 cacheTypeString(cacheType).c_str());
        m_previewLabel->setText(title + " - " + info);
    };

    ImageLoader::setImage(owner, item.url, nullptr, WebImageOptions::NONE, ImageContext(),
                          std::make_shared<ImageViewPresenter>(m_preview), progress, completed);
}

void GalleryActivity::cancelPreview() {
    if (!m_preview) return;
    OwnerRef owner = OwnerRef::of(m_preview);
    brls::Logger::info("GalleryActivity: Cancelling preview of {}", ImageLoader::imageUrl(owner));
    ImageLoader::cancelLatestImageLoad(owner);
    m_previewLabel->setText("Cancelled");
}

} // namespace webimage
