/**
 * BrlsWebImage - Image Cell implementation
 */

#include "view/image_cell.hpp"
#include "view/progress_indicator.hpp"
#include "app/application.hpp"
#include "utils/image_loader.hpp"

#include <vector>

namespace webimage {

static const float IMAGE_WIDTH = 130;
static const float IMAGE_HEIGHT = 130;

ImageCell::ImageCell() {
    this->setAxis(brls::Axis::COLUMN);
    this->setJustifyContent(brls::JustifyContent::FLEX_START);
    this->setAlignItems(brls::AlignItems::CENTER);
    this->setPadding(5);
    this->setFocusable(true);
    this->setCornerRadius(8);
    this->setBackgroundColor(nvgRGBA(50, 50, 50, 255));

    m_image = new brls::Image();
    m_image->setWidth(IMAGE_WIDTH);
    m_image->setHeight(IMAGE_HEIGHT);
    m_image->setScalingType(brls::ImageScalingType::FIT);
    m_image->setCornerRadius(4);
    this->addView(m_image);

    // Load progress, hidden while idle
    m_progressBar = new brls::Rectangle();
    m_progressBar->setHeight(3);
    m_progressBar->setWidth(0);
    m_progressBar->setColor(nvgRGBA(0, 150, 220, 255));
    m_progressBar->setVisibility(brls::Visibility::GONE);
    this->addView(m_progressBar);

    m_titleLabel = new brls::Label();
    m_titleLabel->setFontSize(12);
    m_titleLabel->setMarginTop(5);
    m_titleLabel->setHorizontalAlign(brls::HorizontalAlign::CENTER);
    this->addView(m_titleLabel);

    m_statusLabel = new brls::Label();
    m_statusLabel->setFontSize(10);
    m_statusLabel->setHorizontalAlign(brls::HorizontalAlign::CENTER);
    m_statusLabel->setVisibility(brls::Visibility::GONE);
    this->addView(m_statusLabel);

    m_indicator = std::make_shared<ProgressIndicator>(m_progressBar, IMAGE_WIDTH);
}

ImageCell::~ImageCell() {
    // Pending loads must never reach a destroyed cell
    ImageLoader::detach(OwnerRef::of(this));
}

void ImageCell::setItem(const GalleryItem& item) {
    reset();
    m_item = item;

    std::string title = item.title;
    // Truncate long titles
    if (title.length() > 18) {
        title = title.substr(0, 16) + "...";
    }
    m_titleLabel->setText(title);

    loadImages();
}

void ImageCell::reset() {
    OwnerRef owner = OwnerRef::of(this);
    ImageLoader::cancelImageLoad(owner, OperationKeyResolver::keyForState(owner, ControlState::NORMAL));
    ImageLoader::cancelImageLoad(owner, OperationKeyResolver::keyForState(owner, ControlState::FOCUSED));

    m_state.clear();
    refreshImage();
    m_statusLabel->setVisibility(brls::Visibility::GONE);
}

void ImageCell::installTransition() {
    const AppSettings& settings = Application::getInstance().getSettings();
    OwnerRef owner = OwnerRef::of(this);

    if (!settings.transitionsEnabled) {
        ImageLoader::setImageTransition(owner, nullptr);
        return;
    }

    // Hidden for the prepare turn, revealed when the animation starts. If the
    // run is abandoned in between, the next image or reset reveals the cell.
    auto transition = ImageTransition::fade(settings.transitionDuration);
    transition->prepares = [this](const ImagePtr&, const ImageDataPtr&, CacheType, const std::string&) {
        m_state.hide();
        refreshImage();
    };
    transition->animations = [this](const ImagePtr&) {
        m_state.reveal();
        refreshImage();
    };
    transition->completion = [this](bool finished) {
        if (finished) return;
        m_state.reveal();
        refreshImage();
    };
    ImageLoader::setImageTransition(owner, transition);
}

void ImageCell::loadImages() {
    const AppSettings& settings = Application::getInstance().getSettings();
    OwnerRef owner = OwnerRef::of(this);

    installTransition();
    ImageLoader::setImageIndicator(owner, settings.showProgressIndicator ? m_indicator : nullptr);

    WebImageOptions options = WebImageOptions::NONE;
    if (settings.waitForTransition) options |= WebImageOptions::WAIT_FOR_TRANSITION;
    if (settings.delayPlaceholder) options |= WebImageOptions::DELAY_PLACEHOLDER;

    // The focused image loads once the normal one is done. Both slots share
    // the cell, and only the latest slot may present.
    unsigned int loadCount = ++m_loadCount;
    ImageLoader::setImage(this, ControlState::NORMAL, m_item.url, nullptr, options,
                          [this, options, loadCount](const ImagePtr&, const ImageDataPtr&, const ImageError& error,
                                                     CacheType, bool finished, const std::string&) {
                              if (!finished || loadCount != m_loadCount) return;
                              onLoadFinished(ControlState::NORMAL, error);
                              if (m_item.focusedUrl.empty()) return;
                              ImageLoader::setImage(
                                  this, ControlState::FOCUSED, m_item.focusedUrl, nullptr, options,
                                  [this, loadCount](const ImagePtr&, const ImageDataPtr&, const ImageError& error,
                                                    CacheType, bool finished, const std::string&) {
                                      if (finished && loadCount == m_loadCount) {
                                          onLoadFinished(ControlState::FOCUSED, error);
                                      }
                                  });
                          });
}

void ImageCell::onLoadFinished(ControlState state, const ImageError& error) {
    if (!error.isError()) {
        if (state == ControlState::NORMAL) m_statusLabel->setVisibility(brls::Visibility::GONE);
        return;
    }

    brls::Logger::warning("ImageCell: {} image of '{}' failed: {}", OperationKeyResolver::controlStateString(state),
                          m_item.title, imageErrorCodeString(error.code));
    if (state == ControlState::NORMAL) {
        m_statusLabel->setText(error.code == ImageErrorCode::INVALID_URL ? "No image" : "Failed to load");
        m_statusLabel->setVisibility(brls::Visibility::VISIBLE);
    }
}

void ImageCell::setStateImage(ControlState state, const ImagePtr& image) {
    m_state.setImage(state, image);
    refreshImage();
}

ImagePtr ImageCell::getStateImage(ControlState state) const {
    return m_state.getImage(state);
}

void ImageCell::refreshImage() {
    m_image->setVisibility(m_state.isHidden() ? brls::Visibility::INVISIBLE : brls::Visibility::VISIBLE);

    ImagePtr image = m_state.visibleImage();
    if (image == m_shownImage) return;
    m_shownImage = image;

    if (!image || image->empty()) {
        m_image->clear();
        return;
    }

    // setImageFromMem takes a mutable buffer
    std::vector<uint8_t> bytes(image->bytes(), image->bytes() + image->size());
    m_image->setImageFromMem(bytes.data(), (int)bytes.size());
}

void ImageCell::onFocusGained() {
    brls::Box::onFocusGained();
    m_state.setFocused(true);
    refreshImage();
}

void ImageCell::onFocusLost() {
    brls::Box::onFocusLost();
    m_state.setFocused(false);
    refreshImage();
}

brls::View* ImageCell::create() {
    return new ImageCell();
}

CellStatePresenter::CellStatePresenter(ImageCell* cell, ControlState state) : m_cell(cell), m_state(state) {}

void CellStatePresenter::setImage(const ImagePtr& image, const ImageDataPtr& data, CacheType cacheType,
                                  const std::string& imageUrl) {
    (void)data;
    (void)imageUrl;
    if (!m_cell) return;
    brls::Logger::debug("CellStatePresenter: {} image from {}", OperationKeyResolver::controlStateString(m_state),
                        cacheTypeString(cacheType));
    m_cell->setStateImage(m_state, image);
}

} // namespace webimage
