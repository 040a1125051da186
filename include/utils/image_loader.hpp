/**
 * BrlsWebImage - Image Loader
 * Static entry point views use to load images into themselves
 *
 * Every owner keeps its load state in the shared LoadStateStore. Owners that
 * load images must call detach() from their destructor; pending steps for a
 * detached owner are dropped.
 */

#pragma once

#include "webimage/callback_queue.hpp"
#include "webimage/image_manager.hpp"
#include "webimage/indicator.hpp"
#include "webimage/load_state.hpp"
#include "webimage/operation_key.hpp"
#include "webimage/options.hpp"
#include "webimage/presenter.hpp"
#include "webimage/transition.hpp"

#include <borealis.hpp>
#include <string>

namespace webimage {

class ImageCell;
class LoadOrchestrator;
class OperationRegistry;

class ImageLoader {
public:
    // Generic form: the presenter decides how the result reaches the owner
    static ImageOperationPtr setImage(const OwnerRef& owner, const std::string& url, const ImagePtr& placeholder,
                                      WebImageOptions options, const ImageContext& context,
                                      const ImagePresenterPtr& presenter, ImageProgressCallback progress = nullptr,
                                      ImageCompletionCallback completed = nullptr);

    static ImageOperationPtr setImage(brls::Image* view, const std::string& url, const ImagePtr& placeholder = nullptr,
                                      WebImageOptions options = WebImageOptions::NONE,
                                      ImageCompletionCallback completed = nullptr);

    // One state of a multi-state cell, each state loads under its own key
    static ImageOperationPtr setImage(ImageCell* cell, ControlState state, const std::string& url,
                                      const ImagePtr& placeholder = nullptr,
                                      WebImageOptions options = WebImageOptions::NONE,
                                      ImageCompletionCallback completed = nullptr);

    static void cancelLatestImageLoad(const OwnerRef& owner);
    static void cancelImageLoad(const OwnerRef& owner, const std::string& key);

    static std::string imageUrl(const OwnerRef& owner);
    static ProgressPtr imageProgress(const OwnerRef& owner);
    static void setImageProgress(const OwnerRef& owner, const ProgressPtr& progress);
    static std::string latestOperationKey(const OwnerRef& owner);

    static ImageTransitionPtr imageTransition(const OwnerRef& owner);
    static void setImageTransition(const OwnerRef& owner, const ImageTransitionPtr& transition);

    static ImageIndicatorPtr imageIndicator(const OwnerRef& owner);
    static void setImageIndicator(const OwnerRef& owner, const ImageIndicatorPtr& indicator);

    // Cancel everything the owner has in flight and forget it
    static void detach(const OwnerRef& owner);

    static void setDefaultManager(ImageManagerPtr manager);
    static ImageManagerPtr getDefaultManager();
    static void setDefaultQueue(std::shared_ptr<CallbackQueue> queue);
    static void setDefaultAnimator(TransitionAnimatorPtr animator);

private:
    static OperationRegistry& registry();
    static TransitionCoordinator& transitions();
    static LoadOrchestrator& orchestrator();
};

} // namespace webimage
