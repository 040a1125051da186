/**
 * BrlsWebImage - Load Orchestrator implementation
 */

#include "webimage/load_orchestrator.hpp"
#include "webimage/operation_key.hpp"
#include "webimage/progress_bridge.hpp"
#include "webimage/supersession.hpp"

#include <atomic>
#include <borealis.hpp>
#include <utility>

namespace webimage {

std::string loadPhaseString(LoadPhase phase) {
    switch (phase) {
        case LoadPhase::IDLE: return "idle";
        case LoadPhase::KEY_RESOLVED: return "key resolved";
        case LoadPhase::PREVIOUS_CANCELLED: return "previous cancelled";
        case LoadPhase::PLACEHOLDER_APPLIED: return "placeholder applied";
        case LoadPhase::FETCHING: return "fetching";
        case LoadPhase::RECONCILING: return "reconciling";
        case LoadPhase::APPLIED: return "applied";
        case LoadPhase::REJECTED_STALE: return "rejected as stale";
        case LoadPhase::FAILED: return "failed";
        default: return "unknown";
    }
}

static void logPhase(const std::string& key, LoadPhase phase) {
    brls::Logger::debug("LoadOrchestrator: [{}] {}", key, loadPhaseString(phase));
}

static void startIndicator(const std::shared_ptr<CallbackQueue>& queue, const ImageIndicatorPtr& indicator,
                           const SupersessionToken& token) {
    if (!indicator) return;
    queue->async([indicator, token]() {
        if (!token.isCurrent()) return;
        indicator->startAnimatingIndicator();
    });
}

static void stopIndicator(const std::shared_ptr<CallbackQueue>& queue, const ImageIndicatorPtr& indicator,
                          const SupersessionToken& token) {
    if (!indicator) return;
    queue->async([indicator, token]() {
        // A newer request owns the indicator now
        if (!token.isCurrent()) return;
        indicator->stopAnimatingIndicator();
    });
}

LoadOrchestrator::LoadOrchestrator(LoadStateStore& store, OperationRegistry& registry,
                                   TransitionCoordinator& transitions)
    : m_store(store), m_registry(registry), m_transitions(transitions) {}

void LoadOrchestrator::setDefaultManager(ImageManagerPtr manager) {
    m_defaultManager = std::move(manager);
}

ImageOperationPtr LoadOrchestrator::load(LoadRequest request) {
    OwnerStatePtr state = m_store.acquire(request.owner);
    if (!state) {
        brls::Logger::error("LoadOrchestrator: Refusing to load {} without an owner", request.url);
        return nullptr;
    }

    // Key resolution. The key is echoed into the context so the manager and
    // any repeated call agree on the slot.
    std::string key = OperationKeyResolver::resolve(request.owner, request.context.operationKey);
    request.context.operationKey = key;
    state->latestKey = key;
    logPhase(key, LoadPhase::KEY_RESOLVED);

    if (!hasOption(request.options, WebImageOptions::AVOID_AUTO_CANCEL_PREVIOUS)) {
        m_registry.cancel(request.owner, key);
        logPhase(key, LoadPhase::PREVIOUS_CANCELLED);
    }

    LoadState loadState;
    auto existing = m_store.get(request.owner, key);
    if (existing) {
        loadState = *existing;
    } else {
        // Keep observing a progress handed out before the first request
        auto unkeyed = state->loadStates.find(std::string());
        if (unkeyed != state->loadStates.end() && unkeyed->second.progress) {
            loadState.progress = unkeyed->second.progress;
            state->loadStates.erase(unkeyed);
        }
    }
    loadState.url = request.url;
    loadState.generation = ++state->lastGeneration;
    m_store.set(request.owner, key, loadState);

    SupersessionToken token(state, key, loadState.generation);

    ImageManagerPtr manager = request.context.customManager ? request.context.customManager : m_defaultManager;
    // The manager must not end up holding itself through the context
    request.context.customManager.reset();

    std::shared_ptr<CallbackQueue> queue = request.context.callbackQueue ? request.context.callbackQueue
                                                                         : CallbackQueue::mainQueue();

    if (!hasOption(request.options, WebImageOptions::DELAY_PLACEHOLDER)) {
        if (manager && !request.url.empty()) {
            ImageCachePeek* cache = manager->imageCache();
            if (cache && cache->shouldUseWeakMemoryCache()) {
                // Only refreshes the weak memory layer, the result is not used
                cache->imageFromMemoryCache(manager->cacheKeyForUrl(request.url, request.context));
            }
        }

        ImagePresenterPtr presenter = request.presenter;
        ImagePtr placeholder = request.placeholder;
        std::string url = request.url;
        queue->async([token, presenter, placeholder, url]() {
            if (!token.isCurrent() || !presenter) return;
            presenter->setImage(placeholder, nullptr, CacheType::NONE, url);
        });
        logPhase(key, LoadPhase::PLACEHOLDER_APPLIED);
    }

    ImageIndicatorPtr indicator = state->indicator;

    if (request.url.empty()) {
        fail(request, queue, token, indicator, ImageError::make(ImageErrorCode::INVALID_URL, "Image url is empty"));
        return nullptr;
    }

    if (!manager) {
        brls::Logger::error("LoadOrchestrator: No image manager configured, cannot load {}", request.url);
        fail(request, queue, token, indicator, ImageError::make(ImageErrorCode::FETCH_FAILED, "No image manager"));
        return nullptr;
    }

    if (!loadState.progress) {
        loadState.progress = std::make_shared<Progress>();
        m_store.set(request.owner, key, loadState);
    }
    ProgressPtr progress = loadState.progress;
    progress->claim(loadState.generation);

    startIndicator(queue, indicator, token);

    ProgressBridge bridge(progress, indicator, queue, token, request.progress);

    // Filled once loadImage returns; read only from the callback queue
    auto operation = std::make_shared<ImageOperationPtr>();
    // Set by the final delivery, which may arrive before loadImage returns
    auto delivered = std::make_shared<std::atomic<bool>>(false);

    logPhase(key, LoadPhase::FETCHING);
    LoadRequest captured = request;
    *operation = manager->loadImage(
        request.url, request.options, request.context, bridge.asCallback(),
        [this, captured, token, queue, progress, indicator, operation, delivered](
            const ImagePtr& image, const ImageDataPtr& data, const ImageError& error, CacheType cacheType,
            bool finished, const std::string& imageUrl) {
            if (finished) delivered->store(true);
            reconcile(captured, token, queue, progress, indicator, operation, image, data, error, cacheType,
                      finished, imageUrl);
        });

    // A completion that ran inside loadImage may already have issued a newer
    // request for the key, which owns the registry slot now
    if (!token.isCurrent()) {
        brls::Logger::debug("LoadOrchestrator: [{}] Superseded while issuing, not registering", key);
        return *operation;
    }

    if (delivered->load()) {
        // Nothing left to cancel; still retire whatever the key held before
        m_registry.cancel(request.owner, key);
        return *operation;
    }

    m_registry.set(request.owner, key, *operation);
    return *operation;
}

void LoadOrchestrator::fail(const LoadRequest& request, const std::shared_ptr<CallbackQueue>& queue,
                            const SupersessionToken& token, const ImageIndicatorPtr& indicator,
                            const ImageError& error) {
    logPhase(token.key(), LoadPhase::FAILED);
    if (error.code == ImageErrorCode::INVALID_URL) {
        brls::Logger::warning("LoadOrchestrator: [{}] {}", token.key(), error.message);
    }

    stopIndicator(queue, indicator, token);

    if (!request.completed) return;
    ImageCompletionCallback completed = request.completed;
    std::string url = request.url;
    queue->async([completed, error, url, token]() {
        if (!token.isOwnerAlive()) return;
        completed(nullptr, nullptr, error, CacheType::NONE, true, url);
    });
}

void LoadOrchestrator::reconcile(const LoadRequest& request, const SupersessionToken& token,
                                 const std::shared_ptr<CallbackQueue>& queue, const ProgressPtr& progress,
                                 const ImageIndicatorPtr& indicator,
                                 const std::shared_ptr<ImageOperationPtr>& operation, const ImagePtr& image,
                                 const ImageDataPtr& data, const ImageError& error, CacheType cacheType,
                                 bool finished, const std::string& imageUrl) {
    // The owner went away, nobody is left to show or tell
    if (!token.isOwnerAlive()) return;

    logPhase(token.key(), LoadPhase::RECONCILING);

    if (progress && finished && !error.isError() && progress->isOwnedBy(token.generation()) &&
        progress->isReset()) {
        progress->markUnknownComplete();
    }

    if (error.isError()) {
        brls::Logger::error("LoadOrchestrator: [{}] Load of {} failed: {}", token.key(), request.url,
                            error.message);
    }

    if (finished) {
        stopIndicator(queue, indicator, token);
    }

    WebImageOptions options = request.options;
    bool avoidAutoApply = hasOption(options, WebImageOptions::AVOID_AUTO_APPLY_RESULT);
    bool delayPlaceholder = hasOption(options, WebImageOptions::DELAY_PLACEHOLDER);

    bool shouldCallCompleted = finished || avoidAutoApply;
    bool shouldNotSetImage = avoidAutoApply || (!image && !delayPlaceholder);

    ImageCompletionCallback completed = request.completed;
    std::string url = request.url;
    std::function<void()> callCompleted = [completed, shouldCallCompleted, image, data, error, cacheType,
                                           finished, url]() {
        if (completed && shouldCallCompleted) {
            completed(image, data, error, cacheType, finished, url);
        }
    };

    OwnerRef owner = request.owner;
    OperationRegistry* registry = &m_registry;
    auto forgetOperation = [registry, owner, token, operation, finished]() {
        if (!finished || !*operation) return;
        if (registry->get(owner, token.key()) == *operation) {
            registry->remove(owner, token.key());
        }
    };

    if (shouldNotSetImage) {
        queue->async([token, forgetOperation, callCompleted]() {
            if (!token.isOwnerAlive()) return;
            forgetOperation();
            callCompleted();
        });
        return;
    }

    ImagePtr targetImage;
    ImageDataPtr targetData;
    if (image) {
        targetImage = image;
        targetData = data;
    } else if (delayPlaceholder) {
        targetImage = request.placeholder;
    }

    bool useTransition = finished && TransitionCoordinator::shouldUseTransition(options, cacheType);
    ImagePresenterPtr presenter = request.presenter;
    TransitionCoordinator* transitions = &m_transitions;

    queue->async([token, transitions, presenter, targetImage, targetData, options, useTransition, cacheType,
                  imageUrl, forgetOperation, callCompleted]() {
        forgetOperation();

        OwnerStatePtr owner = token.lockOwner();
        if (!owner) return;

        if (!token.isCurrent()) {
            logPhase(token.key(), LoadPhase::REJECTED_STALE);
            callCompleted();
            return;
        }

        ImageTransitionPtr transition = useTransition ? owner->transition : nullptr;
        transitions->present(token, presenter, targetImage, targetData, options, transition, cacheType, imageUrl,
                             callCompleted);
        logPhase(token.key(), LoadPhase::APPLIED);
    });
}

} // namespace webimage
