/**
 * BrlsWebImage - Image Transitions implementation
 */

#include "webimage/transition.hpp"

#include <borealis.hpp>
#include <utility>

namespace webimage {

std::shared_ptr<ImageTransition> ImageTransition::fade(int durationMs) {
    return custom(durationMs, AnimationCurve::EASE_IN_OUT);
}

std::shared_ptr<ImageTransition> ImageTransition::custom(int durationMs, AnimationCurve curve) {
    auto transition = std::make_shared<ImageTransition>();
    transition->duration = durationMs > 0 ? durationMs : 0;
    transition->curve = curve;
    return transition;
}

void TimerTransitionAnimator::prepare(std::function<void()> body, std::function<void()> done) {
    if (body) body();
    // Next main loop turn, after the placeholder was drawn
    brls::sync([done]() {
        if (done) done();
    });
}

void TimerTransitionAnimator::animate(int durationMs, AnimationCurve curve, std::function<void()> body,
                                      std::function<void(bool)> done) {
    // Nothing is tweened here, the body runs once
    (void)curve;
    if (body) body();
    if (durationMs <= 0) {
        brls::sync([done]() {
            if (done) done(true);
        });
        return;
    }
    brls::delay(durationMs, [done]() {
        if (done) done(true);
    });
}

std::string transitionPhaseString(TransitionPhase phase) {
    switch (phase) {
        case TransitionPhase::NONE: return "none";
        case TransitionPhase::PREPARED: return "prepared";
        case TransitionPhase::ANIMATED: return "animated";
        case TransitionPhase::COMPLETED: return "completed";
        case TransitionPhase::ABANDONED: return "abandoned";
        default: return "unknown";
    }
}

TransitionCoordinator::TransitionCoordinator(TransitionAnimatorPtr animator) : m_animator(std::move(animator)) {}

void TransitionCoordinator::setAnimator(TransitionAnimatorPtr animator) {
    m_animator = std::move(animator);
}

bool TransitionCoordinator::shouldUseTransition(WebImageOptions options, CacheType cacheType) {
    if (hasOption(options, WebImageOptions::FORCE_TRANSITION)) return true;

    switch (cacheType) {
        case CacheType::NONE:
            return true;
        case CacheType::MEMORY:
            return false;
        case CacheType::DISK:
            // Synchronous disk queries show up before the first frame, animating them looks like flicker
            return !(hasOption(options, WebImageOptions::QUERY_MEMORY_DATA_SYNC) ||
                     hasOption(options, WebImageOptions::QUERY_DISK_DATA_SYNC));
        default:
            return false;
    }
}

TransitionRunPtr TransitionCoordinator::present(const SupersessionToken& token, const ImagePresenterPtr& presenter,
                                                const ImagePtr& image, const ImageDataPtr& data,
                                                WebImageOptions options, const ImageTransitionPtr& transition,
                                                CacheType cacheType, const std::string& imageUrl,
                                                std::function<void()> callback) {
    auto run = std::make_shared<TransitionRun>();

    // Nobody is left to tell once the owner detached
    std::function<void()> fireCallback = [run, callback, token]() {
        if (run->callbackFired) return;
        run->callbackFired = true;
        if (callback && token.isOwnerAlive()) callback();
    };

    if (!transition || !m_animator) {
        if (token.isCurrent()) {
            if (presenter) presenter->setImage(image, data, cacheType, imageUrl);
        } else {
            brls::Logger::debug("TransitionCoordinator: Dropping stale result for key {}", token.key());
        }
        fireCallback();
        return run;
    }

    bool waitTransition = hasOption(options, WebImageOptions::WAIT_FOR_TRANSITION);
    std::string key = token.key();

    std::function<void()> abandon = [run, fireCallback, key]() {
        brls::Logger::debug("TransitionCoordinator: Key {} superseded during {} phase", key,
                            transitionPhaseString(run->phase));
        run->phase = TransitionPhase::ABANDONED;
        fireCallback();
    };

    TransitionAnimatorPtr animator = m_animator;

    auto completed = [run, token, transition, abandon, fireCallback](bool finished) {
        if (run->phase != TransitionPhase::ANIMATED) return;
        if (!token.isCurrent()) {
            abandon();
            return;
        }
        run->phase = TransitionPhase::COMPLETED;
        if (transition->completion) transition->completion(finished);
        // Already called at ANIMATED entry unless waiting for the transition
        fireCallback();
    };

    auto animations = [run, token, transition, presenter, image, data, cacheType, imageUrl, waitTransition,
                       abandon, fireCallback]() {
        if (run->phase != TransitionPhase::PREPARED) return;
        if (!token.isCurrent()) {
            abandon();
            return;
        }
        run->phase = TransitionPhase::ANIMATED;
        if (presenter && !transition->avoidAutoSetImage) {
            presenter->setImage(image, data, cacheType, imageUrl);
        }
        if (transition->animations) transition->animations(image);
        if (!waitTransition) fireCallback();
    };

    auto prepares = [run, token, transition, image, data, cacheType, imageUrl, abandon]() {
        if (!token.isCurrent()) {
            abandon();
            return;
        }
        run->phase = TransitionPhase::PREPARED;
        if (transition->prepares) transition->prepares(image, data, cacheType, imageUrl);
    };

    animator->prepare(prepares, [run, animator, transition, animations, completed]() {
        if (run->phase != TransitionPhase::PREPARED) return;
        animator->animate(transition->duration, transition->curve, animations, completed);
    });

    return run;
}

} // namespace webimage
