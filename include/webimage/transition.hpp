/**
 * BrlsWebImage - Image Transitions
 * Multi-phase presentation of a loaded image
 *
 * A transition runs NONE -> PREPARED -> ANIMATED -> COMPLETED. Every phase
 * first checks the request's SupersessionToken; a newer request for the owner
 * moves the run to ABANDONED and no further hook runs. The outer completion is
 * called exactly once: when ANIMATED is entered, or after COMPLETED with
 * WAIT_FOR_TRANSITION, or when the run is abandoned before it was called.
 * It is skipped when the owner detached.
 */

#pragma once

#include "webimage/image.hpp"
#include "webimage/options.hpp"
#include "webimage/presenter.hpp"
#include "webimage/supersession.hpp"

#include <functional>
#include <memory>
#include <string>

namespace webimage {

enum class AnimationCurve {
    LINEAR,
    EASE_IN,
    EASE_OUT,
    EASE_IN_OUT
};

struct ImageTransition {
    int duration = 500;  // ms
    AnimationCurve curve = AnimationCurve::EASE_IN_OUT;

    // Leave applying the image to the animations hook
    bool avoidAutoSetImage = false;

    // (image, data, cacheType, imageUrl), zero-duration phase
    std::function<void(const ImagePtr&, const ImageDataPtr&, CacheType, const std::string&)> prepares;
    // Runs when the animated phase starts
    std::function<void(const ImagePtr&)> animations;
    // finished is false when the animation was interrupted
    std::function<void(bool)> completion;

    // Cross-fade. Owners that can fade install the prepares/animations hooks.
    static std::shared_ptr<ImageTransition> fade(int durationMs = 500);
    static std::shared_ptr<ImageTransition> custom(int durationMs, AnimationCurve curve);
};

using ImageTransitionPtr = std::shared_ptr<ImageTransition>;

class TransitionAnimator {
public:
    virtual ~TransitionAnimator() = default;

    // Runs body, then done once the owner had a chance to draw
    virtual void prepare(std::function<void()> body, std::function<void()> done) = 0;

    // Runs body, then done(finished) after durationMs
    virtual void animate(int durationMs, AnimationCurve curve, std::function<void()> body,
                         std::function<void(bool)> done) = 0;
};

using TransitionAnimatorPtr = std::shared_ptr<TransitionAnimator>;

/**
 * Runs phases on the borealis main loop: prepare completes on the next
 * brls::sync turn, animate completes with brls::delay. The animations hook
 * runs once at the start of the phase, so there is no per-frame easing and
 * the curve is ignored. Animators that tween a property use it.
 */
class TimerTransitionAnimator : public TransitionAnimator {
public:
    void prepare(std::function<void()> body, std::function<void()> done) override;
    void animate(int durationMs, AnimationCurve curve, std::function<void()> body,
                 std::function<void(bool)> done) override;
};

enum class TransitionPhase {
    NONE,
    PREPARED,
    ANIMATED,
    COMPLETED,
    ABANDONED
};

std::string transitionPhaseString(TransitionPhase phase);

// State of one presentation
struct TransitionRun {
    TransitionPhase phase = TransitionPhase::NONE;
    bool callbackFired = false;
};

using TransitionRunPtr = std::shared_ptr<TransitionRun>;

class TransitionCoordinator {
public:
    explicit TransitionCoordinator(TransitionAnimatorPtr animator);

    // Must be called on the callback queue. transition may be null, in which
    // case the image is applied right away and callback is called.
    TransitionRunPtr present(const SupersessionToken& token, const ImagePresenterPtr& presenter,
                             const ImagePtr& image, const ImageDataPtr& data, WebImageOptions options,
                             const ImageTransitionPtr& transition, CacheType cacheType,
                             const std::string& imageUrl, std::function<void()> callback);

    // Whether a result from cacheType should be shown with the owner's transition
    static bool shouldUseTransition(WebImageOptions options, CacheType cacheType);

    void setAnimator(TransitionAnimatorPtr animator);
    const TransitionAnimatorPtr& getAnimator() const { return m_animator; }

private:
    TransitionAnimatorPtr m_animator;
};

} // namespace webimage
