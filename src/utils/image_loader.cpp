/**
 * BrlsWebImage - Image Loader implementation
 */

#include "utils/image_loader.hpp"
#include "view/image_cell.hpp"
#include "webimage/load_orchestrator.hpp"
#include "webimage/operation_registry.hpp"

#include <utility>

namespace webimage {

OperationRegistry& ImageLoader::registry() {
    static OperationRegistry instance(LoadStateStore::getInstance());
    return instance;
}

TransitionCoordinator& ImageLoader::transitions() {
    static TransitionCoordinator instance(std::make_shared<TimerTransitionAnimator>());
    return instance;
}

LoadOrchestrator& ImageLoader::orchestrator() {
    static LoadOrchestrator instance(LoadStateStore::getInstance(), registry(), transitions());
    return instance;
}

ImageOperationPtr ImageLoader::setImage(const OwnerRef& owner, const std::string& url, const ImagePtr& placeholder,
                                        WebImageOptions options, const ImageContext& context,
                                        const ImagePresenterPtr& presenter, ImageProgressCallback progress,
                                        ImageCompletionCallback completed) {
    if (!owner.valid()) {
        brls::Logger::error("ImageLoader: setImage called without an owner ({})", url);
        return nullptr;
    }

    LoadRequest request;
    request.owner = owner;
    request.url = url;
    request.placeholder = placeholder;
    request.options = options;
    request.context = context;
    request.presenter = presenter;
    request.progress = std::move(progress);
    request.completed = std::move(completed);
    return orchestrator().load(std::move(request));
}

ImageOperationPtr ImageLoader::setImage(brls::Image* view, const std::string& url, const ImagePtr& placeholder,
                                        WebImageOptions options, ImageCompletionCallback completed) {
    if (!view) return nullptr;
    return setImage(OwnerRef::of(view), url, placeholder, options, ImageContext(),
                    std::make_shared<ImageViewPresenter>(view), nullptr, std::move(completed));
}

ImageOperationPtr ImageLoader::setImage(ImageCell* cell, ControlState state, const std::string& url,
                                        const ImagePtr& placeholder, WebImageOptions options,
                                        ImageCompletionCallback completed) {
    if (!cell) return nullptr;

    OwnerRef owner = OwnerRef::of(cell);
    ImageContext context;
    context.operationKey = OperationKeyResolver::keyForState(owner, state);
    return setImage(owner, url, placeholder, options, context, std::make_shared<CellStatePresenter>(cell, state),
                    nullptr, std::move(completed));
}

void ImageLoader::cancelLatestImageLoad(const OwnerRef& owner) {
    registry().cancelLatest(owner);
}

void ImageLoader::cancelImageLoad(const OwnerRef& owner, const std::string& key) {
    registry().cancel(owner, key);
}

std::string ImageLoader::imageUrl(const OwnerRef& owner) {
    return LoadStateStore::getInstance().imageUrl(owner);
}

ProgressPtr ImageLoader::imageProgress(const OwnerRef& owner) {
    return LoadStateStore::getInstance().imageProgress(owner);
}

void ImageLoader::setImageProgress(const OwnerRef& owner, const ProgressPtr& progress) {
    LoadStateStore::getInstance().setImageProgress(owner, progress);
}

std::string ImageLoader::latestOperationKey(const OwnerRef& owner) {
    return LoadStateStore::getInstance().latestKey(owner);
}

ImageTransitionPtr ImageLoader::imageTransition(const OwnerRef& owner) {
    OwnerStatePtr state = LoadStateStore::getInstance().find(owner);
    return state ? state->transition : nullptr;
}

void ImageLoader::setImageTransition(const OwnerRef& owner, const ImageTransitionPtr& transition) {
    OwnerStatePtr state = LoadStateStore::getInstance().acquire(owner);
    if (state) state->transition = transition;
}

ImageIndicatorPtr ImageLoader::imageIndicator(const OwnerRef& owner) {
    OwnerStatePtr state = LoadStateStore::getInstance().find(owner);
    return state ? state->indicator : nullptr;
}

void ImageLoader::setImageIndicator(const OwnerRef& owner, const ImageIndicatorPtr& indicator) {
    OwnerStatePtr state = LoadStateStore::getInstance().acquire(owner);
    if (!state) return;

    // The old indicator must not keep spinning for a load it no longer tracks
    if (state->indicator && state->indicator != indicator) {
        state->indicator->stopAnimatingIndicator();
    }
    state->indicator = indicator;
}

void ImageLoader::detach(const OwnerRef& owner) {
    registry().cancelAll(owner);
    LoadStateStore::getInstance().detach(owner);
}

void ImageLoader::setDefaultManager(ImageManagerPtr manager) {
    orchestrator().setDefaultManager(std::move(manager));
}

ImageManagerPtr ImageLoader::getDefaultManager() {
    return orchestrator().getDefaultManager();
}

void ImageLoader::setDefaultQueue(std::shared_ptr<CallbackQueue> queue) {
    CallbackQueue::setMainQueue(std::move(queue));
}

void ImageLoader::setDefaultAnimator(TransitionAnimatorPtr animator) {
    transitions().setAnimator(std::move(animator));
}

} // namespace webimage
