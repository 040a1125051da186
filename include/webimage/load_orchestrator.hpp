/**
 * BrlsWebImage - Load Orchestrator
 * Issues a load for an owner slot and reconciles its result
 *
 * Request lifecycle:
 *   IDLE -> KEY_RESOLVED -> PREVIOUS_CANCELLED -> PLACEHOLDER_APPLIED
 *        -> FETCHING -> RECONCILING -> APPLIED | REJECTED_STALE | FAILED
 *
 * Everything up to FETCHING happens synchronously in load(). The manager's
 * completion arrives on any thread; from there every step that touches the
 * owner is submitted to the request's callback queue and re-checks the
 * request's SupersessionToken first.
 */

#pragma once

#include "webimage/callback_queue.hpp"
#include "webimage/image_manager.hpp"
#include "webimage/load_state.hpp"
#include "webimage/operation_registry.hpp"
#include "webimage/presenter.hpp"
#include "webimage/transition.hpp"

#include <memory>
#include <string>

namespace webimage {

enum class LoadPhase {
    IDLE,
    KEY_RESOLVED,
    PREVIOUS_CANCELLED,
    PLACEHOLDER_APPLIED,
    FETCHING,
    RECONCILING,
    APPLIED,
    REJECTED_STALE,
    FAILED
};

std::string loadPhaseString(LoadPhase phase);

struct LoadRequest {
    OwnerRef owner;
    std::string url;                    // Empty: nothing to load
    ImagePtr placeholder;
    WebImageOptions options = WebImageOptions::NONE;
    ImageContext context;
    ImagePresenterPtr presenter;        // Null: nothing is applied to the owner
    ImageProgressCallback progress;     // Called on the fetch thread
    ImageCompletionCallback completed;  // Called on the callback queue
};

class LoadOrchestrator {
public:
    LoadOrchestrator(LoadStateStore& store, OperationRegistry& registry, TransitionCoordinator& transitions);

    // Returns the manager's operation, null when nothing was fetched
    ImageOperationPtr load(LoadRequest request);

    void setDefaultManager(ImageManagerPtr manager);
    const ImageManagerPtr& getDefaultManager() const { return m_defaultManager; }

private:
    // Manager completion, any thread
    void reconcile(const LoadRequest& request, const SupersessionToken& token,
                   const std::shared_ptr<CallbackQueue>& queue, const ProgressPtr& progress,
                   const ImageIndicatorPtr& indicator, const std::shared_ptr<ImageOperationPtr>& operation,
                   const ImagePtr& image, const ImageDataPtr& data, const ImageError& error,
                   CacheType cacheType, bool finished, const std::string& imageUrl);

    void fail(const LoadRequest& request, const std::shared_ptr<CallbackQueue>& queue,
              const SupersessionToken& token, const ImageIndicatorPtr& indicator, const ImageError& error);

    LoadStateStore& m_store;
    OperationRegistry& m_registry;
    TransitionCoordinator& m_transitions;
    ImageManagerPtr m_defaultManager;
};

} // namespace webimage
