/**
 * BrlsWebImage - LoadOrchestrator tests
 */

#include "test_support.hpp"
#include "webimage/load_orchestrator.hpp"
#include "webimage/operation_key.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>

namespace webimage {
namespace {

using ::testing::ElementsAre;
using test::CompletionLog;
using test::FakeImageManager;
using test::FakeIndicator;
using test::FakeView;
using test::InlineQueue;
using test::ManualAnimator;
using test::ManualQueue;
using test::RecordingPresenter;

class LoadOrchestratorTest : public ::testing::Test {
protected:
    LoadOrchestratorTest() { m_orchestrator.setDefaultManager(m_manager); }

    OwnerRef owner() { return OwnerRef::of(&m_view); }
    std::string key() { return OperationKeyResolver::defaultKey(owner()); }

    LoadRequest request(const std::string& url, WebImageOptions options = WebImageOptions::NONE) {
        LoadRequest request;
        request.owner = owner();
        request.url = url;
        request.placeholder = m_placeholder;
        request.options = options;
        request.context.callbackQueue = m_queue;
        request.presenter = m_presenter;
        request.completed = m_log.callback();
        return request;
    }

    void useFade(int durationMs = 200) { m_store.acquire(owner())->transition = ImageTransition::fade(durationMs); }

    std::shared_ptr<FakeIndicator> useIndicator() {
        auto indicator = std::make_shared<FakeIndicator>();
        m_store.acquire(owner())->indicator = indicator;
        return indicator;
    }

    bool presented(const ImagePtr& image) const {
        const auto& calls = m_presenter->calls;
        return std::any_of(calls.begin(), calls.end(),
                           [&image](const RecordingPresenter::Call& call) { return call.image == image; });
    }

    LoadStateStore m_store;
    OperationRegistry m_registry{m_store};
    std::shared_ptr<ManualAnimator> m_animator = std::make_shared<ManualAnimator>();
    TransitionCoordinator m_transitions{m_animator};
    LoadOrchestrator m_orchestrator{m_store, m_registry, m_transitions};

    std::shared_ptr<FakeImageManager> m_manager = std::make_shared<FakeImageManager>();
    std::shared_ptr<ManualQueue> m_queue = std::make_shared<ManualQueue>();
    std::shared_ptr<RecordingPresenter> m_presenter = std::make_shared<RecordingPresenter>();
    CompletionLog m_log;

    FakeView m_view;
    ImagePtr m_placeholder = test::makeImage({0});
    ImagePtr m_imageA = test::makeImage({1});
    ImagePtr m_imageB = test::makeImage({2});
};

TEST_F(LoadOrchestratorTest, RecordsUrlBeforeAnythingIsDelivered) {
    ImageOperationPtr operation = m_orchestrator.load(request("https://example.com/a.png"));

    EXPECT_EQ(m_store.imageUrl(owner()), "https://example.com/a.png");
    EXPECT_EQ(m_store.latestKey(owner()), key());
    ASSERT_EQ(m_manager->requests.size(), 1u);
    EXPECT_EQ(operation, m_manager->last().operation);
    EXPECT_TRUE(m_registry.has(owner(), key()));
    EXPECT_TRUE(m_presenter->calls.empty());
}

TEST_F(LoadOrchestratorTest, ResolvedKeyIsPassedToManager) {
    m_orchestrator.load(request("a"));
    EXPECT_EQ(m_manager->last().context.operationKey, key());

    LoadRequest explicitKey = request("b");
    explicitKey.context.operationKey = "avatar";
    m_orchestrator.load(explicitKey);

    EXPECT_EQ(m_manager->last().context.operationKey, "avatar");
    EXPECT_EQ(m_store.latestKey(owner()), "avatar");
    EXPECT_EQ(m_store.imageUrl(owner()), "b");
}

TEST_F(LoadOrchestratorTest, CustomManagerIsUsedAndNotForwarded) {
    auto custom = std::make_shared<FakeImageManager>();
    LoadRequest withManager = request("a");
    withManager.context.customManager = custom;

    m_orchestrator.load(withManager);

    EXPECT_TRUE(m_manager->requests.empty());
    ASSERT_EQ(custom->requests.size(), 1u);
    EXPECT_EQ(custom->last().context.customManager, nullptr);
    EXPECT_EQ(custom->last().context.callbackQueue, m_queue);
}

TEST_F(LoadOrchestratorTest, PlaceholderIsAppliedOnCallbackQueue) {
    m_orchestrator.load(request("a"));
    EXPECT_TRUE(m_presenter->calls.empty());

    m_queue->drain();

    ASSERT_EQ(m_presenter->calls.size(), 1u);
    EXPECT_EQ(m_presenter->calls[0].image, m_placeholder);
    EXPECT_EQ(m_presenter->calls[0].cacheType, CacheType::NONE);
    EXPECT_EQ(m_presenter->calls[0].imageUrl, "a");
    EXPECT_THAT(m_manager->peekedKeys, ElementsAre("a"));
}

TEST_F(LoadOrchestratorTest, DelayPlaceholderSkipsPlaceholderAndPeek) {
    m_orchestrator.load(request("a", WebImageOptions::DELAY_PLACEHOLDER));
    m_queue->drain();

    EXPECT_TRUE(m_presenter->calls.empty());
    EXPECT_TRUE(m_manager->peekedKeys.empty());
}

TEST_F(LoadOrchestratorTest, MemoryCacheIsOnlyPeekedWithWeakLayer) {
    m_manager->weakMemoryCache = false;
    m_orchestrator.load(request("a"));

    m_manager->weakMemoryCache = true;
    m_manager->exposeCache = false;
    m_orchestrator.load(request("b"));

    EXPECT_TRUE(m_manager->peekedKeys.empty());
}

TEST_F(LoadOrchestratorTest, NewRequestCancelsPreviousBeforeIssuing) {
    m_orchestrator.load(request("a"));
    auto first = m_manager->requests[0].operation;

    bool cancelledAtIssue = false;
    m_manager->onLoad = [&](const std::string&) { cancelledAtIssue = first->isCancelled(); };
    m_orchestrator.load(request("b"));

    EXPECT_TRUE(cancelledAtIssue);
    EXPECT_EQ(first->cancelCount(), 1);
    EXPECT_EQ(m_registry.get(owner(), key()), m_manager->requests[1].operation);
}

TEST_F(LoadOrchestratorTest, AvoidAutoCancelKeepsPreviousRunningUntilReplaced) {
    m_orchestrator.load(request("a"));
    auto first = m_manager->requests[0].operation;

    bool cancelledAtIssue = true;
    m_manager->onLoad = [&](const std::string&) { cancelledAtIssue = first->isCancelled(); };
    m_orchestrator.load(request("b", WebImageOptions::AVOID_AUTO_CANCEL_PREVIOUS));

    EXPECT_FALSE(cancelledAtIssue);
    // The slot holds one operation, registering the new one retires the old
    EXPECT_EQ(first->cancelCount(), 1);
    EXPECT_EQ(m_registry.get(owner(), key()), m_manager->requests[1].operation);
}

TEST_F(LoadOrchestratorTest, LatestRequestWinsWhateverTheCompletionOrder) {
    m_orchestrator.load(request("a"));
    m_orchestrator.load(request("b"));

    m_manager->requests[1].complete(m_imageB, CacheType::NONE);
    m_manager->requests[0].complete(m_imageA, CacheType::NONE);
    m_queue->drain();

    EXPECT_EQ(m_presenter->current, m_imageB);
    EXPECT_FALSE(presented(m_imageA));

    // The stale request is still told about its result
    ASSERT_EQ(m_log.entries.size(), 2u);
    EXPECT_EQ(m_log.entries[0].image, m_imageB);
    EXPECT_EQ(m_log.entries[0].url, "b");
    EXPECT_EQ(m_log.entries[1].image, m_imageA);
    EXPECT_EQ(m_log.entries[1].url, "a");
    EXPECT_TRUE(m_log.entries[1].finished);
}

TEST_F(LoadOrchestratorTest, StaleResultNeverOverwritesPlaceholder) {
    m_orchestrator.load(request("a"));
    m_orchestrator.load(request("b"));

    m_manager->requests[0].complete(m_imageA, CacheType::NONE);
    m_queue->drain();

    EXPECT_EQ(m_presenter->current, m_placeholder);
    EXPECT_EQ(m_log.entries.size(), 1u);
    EXPECT_EQ(m_store.imageUrl(owner()), "b");

    m_manager->requests[1].complete(m_imageB, CacheType::NONE);
    m_queue->drain();
    EXPECT_EQ(m_presenter->current, m_imageB);
}

TEST_F(LoadOrchestratorTest, RequestOnAnotherKeyMakesResultStale) {
    LoadRequest one = request("a");
    one.context.operationKey = "one";
    LoadRequest two = request("b");
    two.context.operationKey = "two";

    m_orchestrator.load(one);
    m_orchestrator.load(two);
    m_manager->requests[0].complete(m_imageA, CacheType::NONE);
    m_queue->drain();

    EXPECT_EQ(m_manager->requests[0].operation->cancelCount(), 0);
    EXPECT_FALSE(presented(m_imageA));
    EXPECT_EQ(m_log.entries.size(), 1u);
}

TEST_F(LoadOrchestratorTest, OwnersAreIndependent) {
    FakeView other;
    auto otherPresenter = std::make_shared<RecordingPresenter>();
    LoadRequest otherRequest = request("b");
    otherRequest.owner = OwnerRef::of(&other);
    otherRequest.presenter = otherPresenter;

    m_orchestrator.load(request("a"));
    m_orchestrator.load(otherRequest);
    m_manager->requests[0].complete(m_imageA, CacheType::NONE);
    m_manager->requests[1].complete(m_imageB, CacheType::NONE);
    m_queue->drain();

    EXPECT_EQ(m_manager->requests[0].operation->cancelCount(), 0);
    EXPECT_EQ(m_presenter->current, m_imageA);
    EXPECT_EQ(otherPresenter->current, m_imageB);
}

TEST_F(LoadOrchestratorTest, MemoryHitCompletesOnceWithoutTransition) {
    useFade();
    m_manager->syncImage = m_imageA;

    m_orchestrator.load(request("x"));
    m_queue->drain();

    ASSERT_EQ(m_log.entries.size(), 1u);
    EXPECT_EQ(m_log.entries[0].image, m_imageA);
    EXPECT_FALSE(m_log.entries[0].error.isError());
    EXPECT_EQ(m_log.entries[0].cacheType, CacheType::MEMORY);
    EXPECT_TRUE(m_log.entries[0].finished);
    EXPECT_EQ(m_log.entries[0].url, "x");

    EXPECT_EQ(m_animator->prepares, 0);
    ASSERT_EQ(m_presenter->calls.size(), 2u);
    EXPECT_EQ(m_presenter->calls[0].image, m_placeholder);
    EXPECT_EQ(m_presenter->calls[1].image, m_imageA);
    EXPECT_FALSE(m_registry.has(owner(), key()));
}

TEST_F(LoadOrchestratorTest, EmptyUrlFailsWithInvalidUrl) {
    auto indicator = useIndicator();

    ImageOperationPtr operation = m_orchestrator.load(request(""));
    m_queue->drain();

    EXPECT_EQ(operation, nullptr);
    EXPECT_TRUE(m_manager->requests.empty());
    ASSERT_EQ(m_log.entries.size(), 1u);
    EXPECT_EQ(m_log.entries[0].image, nullptr);
    EXPECT_EQ(m_log.entries[0].error.code, ImageErrorCode::INVALID_URL);
    EXPECT_EQ(m_log.entries[0].cacheType, CacheType::NONE);
    EXPECT_TRUE(m_log.entries[0].finished);
    EXPECT_EQ(m_log.entries[0].url, "");

    // Placeholder still shown, nothing left spinning
    EXPECT_EQ(m_presenter->current, m_placeholder);
    EXPECT_EQ(indicator->starts, 0);
    EXPECT_EQ(indicator->stops, 1);
}

TEST_F(LoadOrchestratorTest, MissingManagerFailsWithFetchFailed) {
    m_orchestrator.setDefaultManager(nullptr);

    EXPECT_EQ(m_orchestrator.load(request("a")), nullptr);
    m_queue->drain();

    ASSERT_EQ(m_log.entries.size(), 1u);
    EXPECT_EQ(m_log.entries[0].error.code, ImageErrorCode::FETCH_FAILED);
    EXPECT_EQ(m_log.entries[0].url, "a");
}

TEST_F(LoadOrchestratorTest, FailureShowsDelayedPlaceholder) {
    m_orchestrator.load(request("a", WebImageOptions::DELAY_PLACEHOLDER));
    m_queue->drain();
    EXPECT_TRUE(m_presenter->calls.empty());

    m_manager->last().fail("timeout");
    m_queue->drain();

    ASSERT_EQ(m_presenter->calls.size(), 1u);
    EXPECT_EQ(m_presenter->calls[0].image, m_placeholder);
    ASSERT_EQ(m_log.entries.size(), 1u);
    EXPECT_EQ(m_log.entries[0].image, nullptr);
    EXPECT_EQ(m_log.entries[0].error.code, ImageErrorCode::FETCH_FAILED);
    EXPECT_EQ(m_log.entries[0].error.message, "timeout");
}

TEST_F(LoadOrchestratorTest, FailureKeepsEarlyPlaceholder) {
    m_orchestrator.load(request("a"));
    m_manager->last().fail("timeout");
    m_queue->drain();

    ASSERT_EQ(m_presenter->calls.size(), 1u);
    EXPECT_EQ(m_presenter->calls[0].image, m_placeholder);
    ASSERT_EQ(m_log.entries.size(), 1u);
    EXPECT_TRUE(m_log.entries[0].error.isError());
}

TEST_F(LoadOrchestratorTest, AvoidAutoApplyNeverTouchesOwner) {
    m_orchestrator.load(
        request("a", WebImageOptions::DELAY_PLACEHOLDER | WebImageOptions::AVOID_AUTO_APPLY_RESULT));
    m_manager->last().fail("timeout");
    m_queue->drain();

    EXPECT_TRUE(m_presenter->calls.empty());
    ASSERT_EQ(m_log.entries.size(), 1u);
    EXPECT_EQ(m_log.entries[0].error.code, ImageErrorCode::FETCH_FAILED);
}

TEST_F(LoadOrchestratorTest, AvoidAutoApplyReportsEveryDelivery) {
    useFade();
    m_orchestrator.load(request("a", WebImageOptions::AVOID_AUTO_APPLY_RESULT));
    m_manager->last().complete(m_imageA, CacheType::NONE, false);
    m_manager->last().complete(m_imageB, CacheType::NONE, true);
    m_queue->drain();

    ASSERT_EQ(m_log.entries.size(), 2u);
    EXPECT_EQ(m_log.entries[0].image, m_imageA);
    EXPECT_FALSE(m_log.entries[0].finished);
    EXPECT_EQ(m_log.entries[1].image, m_imageB);
    EXPECT_TRUE(m_log.entries[1].finished);

    EXPECT_FALSE(presented(m_imageA));
    EXPECT_FALSE(presented(m_imageB));
    EXPECT_EQ(m_animator->prepares, 0);
}

TEST_F(LoadOrchestratorTest, PartialImageIsShownWithoutCompletion) {
    useFade();
    m_orchestrator.load(request("a"));

    m_manager->last().complete(m_imageA, CacheType::NONE, false);
    m_queue->drain();

    EXPECT_EQ(m_presenter->current, m_imageA);
    EXPECT_EQ(m_animator->prepares, 0);
    EXPECT_TRUE(m_log.entries.empty());
    EXPECT_TRUE(m_registry.has(owner(), key()));

    m_manager->last().complete(m_imageB, CacheType::NONE, true);
    m_queue->drain();
    EXPECT_EQ(m_animator->prepares, 1);

    m_animator->finishPrepare();
    EXPECT_EQ(m_presenter->current, m_imageB);
    EXPECT_EQ(m_log.entries.size(), 1u);
}

TEST_F(LoadOrchestratorTest, FinishedLoadForgetsItsOperation) {
    m_orchestrator.load(request("a"));
    EXPECT_TRUE(m_registry.has(owner(), key()));

    m_manager->last().complete(m_imageA, CacheType::NONE);
    m_queue->drain();

    EXPECT_FALSE(m_registry.has(owner(), key()));
    EXPECT_EQ(m_manager->last().operation->cancelCount(), 0);
}

TEST_F(LoadOrchestratorTest, ProgressWithoutSamplesEndsAsUnknownComplete) {
    m_orchestrator.load(request("a"));
    ProgressPtr progress = m_store.get(owner(), key())->progress;
    ASSERT_NE(progress, nullptr);
    EXPECT_TRUE(progress->isReset());

    m_manager->last().complete(m_imageA, CacheType::NONE);

    EXPECT_TRUE(progress->isUnknownComplete());
}

TEST_F(LoadOrchestratorTest, ProgressKeepsReportedSamples) {
    m_orchestrator.load(request("a"));
    ProgressPtr progress = m_store.get(owner(), key())->progress;

    m_manager->last().progress(30, 60, "a");
    m_manager->last().complete(m_imageA, CacheType::NONE);

    EXPECT_EQ(progress->completedUnitCount(), 30);
    EXPECT_EQ(progress->totalUnitCount(), 60);

    // Same slot, same Progress, counters start over
    m_orchestrator.load(request("b"));
    EXPECT_EQ(m_store.get(owner(), key())->progress, progress);
    EXPECT_TRUE(progress->isReset());
}

TEST_F(LoadOrchestratorTest, SupersededLoadCannotWriteNewerProgress) {
    m_orchestrator.load(request("a"));
    m_orchestrator.load(request("b"));
    ProgressPtr progress = m_store.get(owner(), key())->progress;

    // Cancellation is a hint, the older fetch keeps delivering
    m_manager->requests[0].progress(900, 1000, "a");
    EXPECT_TRUE(progress->isReset());

    m_manager->requests[0].complete(m_imageA, CacheType::NONE);
    EXPECT_TRUE(progress->isReset());
    EXPECT_FALSE(progress->isUnknownComplete());

    m_manager->requests[1].progress(10, 20, "b");
    EXPECT_EQ(progress->completedUnitCount(), 10);
    EXPECT_EQ(progress->totalUnitCount(), 20);
}

TEST_F(LoadOrchestratorTest, SupersededLoadDoesNotMarkNewerProgressComplete) {
    m_orchestrator.load(request("a"));
    m_orchestrator.load(request("b"));
    ProgressPtr progress = m_store.get(owner(), key())->progress;

    m_manager->requests[0].complete(m_imageA, CacheType::NONE);
    EXPECT_TRUE(progress->isReset());

    m_manager->requests[1].complete(m_imageB, CacheType::NONE);
    EXPECT_TRUE(progress->isUnknownComplete());
}

TEST_F(LoadOrchestratorTest, RetryFromSynchronousCompletionKeepsNewerOperation) {
    auto inlineQueue = std::make_shared<InlineQueue>();
    m_manager->syncImage = m_imageA;

    int completions = 0;
    LoadRequest first = request("a");
    first.context.callbackQueue = inlineQueue;
    first.completed = [&](const ImagePtr&, const ImageDataPtr&, const ImageError&, CacheType, bool finished,
                          const std::string&) {
        completions++;
        if (!finished || completions > 1) return;
        // Reload the same slot from inside the memory-hit completion
        m_manager->syncImage = nullptr;
        LoadRequest retry = request("b");
        retry.context.callbackQueue = inlineQueue;
        m_orchestrator.load(retry);
    };

    m_orchestrator.load(first);

    ASSERT_EQ(m_manager->requests.size(), 2u);
    auto newer = m_manager->requests[1].operation;
    EXPECT_EQ(newer->cancelCount(), 0);
    EXPECT_EQ(m_registry.get(owner(), key()), newer);
    EXPECT_EQ(m_store.imageUrl(owner()), "b");

    m_manager->requests[1].complete(m_imageB, CacheType::NONE);
    EXPECT_EQ(m_presenter->current, m_imageB);
    EXPECT_FALSE(m_registry.has(owner(), key()));
}

TEST_F(LoadOrchestratorTest, SynchronousHitRetiresPreviousOperation) {
    m_orchestrator.load(request("a"));
    auto first = m_manager->requests[0].operation;

    m_manager->syncImage = m_imageB;
    m_orchestrator.load(request("b", WebImageOptions::AVOID_AUTO_CANCEL_PREVIOUS));

    EXPECT_EQ(first->cancelCount(), 1);
    EXPECT_FALSE(m_registry.has(owner(), key()));
}

TEST_F(LoadOrchestratorTest, ProgressHandedOutBeforeFirstLoadIsKept) {
    ProgressPtr early = m_store.imageProgress(owner());

    m_orchestrator.load(request("a"));

    EXPECT_EQ(m_store.get(owner(), key())->progress, early);
    EXPECT_EQ(m_store.imageProgress(owner()), early);
}

TEST_F(LoadOrchestratorTest, ProgressObserverRunsOnFetchThread) {
    std::vector<int64_t> samples;
    LoadRequest observed = request("a");
    observed.progress = [&samples](int64_t received, int64_t, const std::string&) { samples.push_back(received); };
    m_orchestrator.load(observed);

    m_manager->last().progress(10, 100, "a");
    m_manager->last().progress(40, 100, "a");

    EXPECT_THAT(samples, ElementsAre(10, 40));
}

TEST_F(LoadOrchestratorTest, IndicatorFollowsTheLoad) {
    auto indicator = useIndicator();

    m_orchestrator.load(request("a"));
    m_queue->drain();
    EXPECT_EQ(indicator->starts, 1);

    m_manager->last().progress(50, 100, "a");
    m_queue->drain();
    EXPECT_THAT(indicator->updates, ElementsAre(0.5));

    m_manager->last().complete(m_imageA, CacheType::NONE);
    m_queue->drain();
    EXPECT_EQ(indicator->stops, 1);
}

TEST_F(LoadOrchestratorTest, SupersededLoadLeavesIndicatorToNewerOne) {
    auto indicator = useIndicator();

    m_orchestrator.load(request("a"));
    m_orchestrator.load(request("b"));
    m_queue->drain();
    EXPECT_EQ(indicator->starts, 1);

    m_manager->requests[0].complete(m_imageA, CacheType::NONE);
    m_queue->drain();
    EXPECT_EQ(indicator->stops, 0);

    m_manager->requests[1].complete(m_imageB, CacheType::NONE);
    m_queue->drain();
    EXPECT_EQ(indicator->stops, 1);
}

TEST_F(LoadOrchestratorTest, NetworkResultFadesIn) {
    useFade(200);
    m_orchestrator.load(request("a"));
    m_manager->last().complete(m_imageA, CacheType::NONE);
    m_queue->drain();

    EXPECT_EQ(m_animator->prepares, 1);
    EXPECT_EQ(m_presenter->current, m_placeholder);
    EXPECT_TRUE(m_log.entries.empty());

    m_animator->finishPrepare();
    EXPECT_EQ(m_presenter->current, m_imageA);
    EXPECT_EQ(m_animator->lastDuration, 200);
    EXPECT_EQ(m_log.entries.size(), 1u);

    m_animator->finishAnimation();
    EXPECT_EQ(m_log.entries.size(), 1u);
}

TEST_F(LoadOrchestratorTest, WaitForTransitionDelaysCompletion) {
    useFade();
    m_orchestrator.load(request("a", WebImageOptions::WAIT_FOR_TRANSITION));
    m_manager->last().complete(m_imageA, CacheType::NONE);
    m_queue->drain();

    m_animator->finishPrepare();
    EXPECT_EQ(m_presenter->current, m_imageA);
    EXPECT_TRUE(m_log.entries.empty());

    m_animator->finishAnimation();
    EXPECT_EQ(m_log.entries.size(), 1u);
}

TEST_F(LoadOrchestratorTest, SupersededDuringTransitionIsAbandoned) {
    useFade();
    m_orchestrator.load(request("a"));
    m_manager->last().complete(m_imageA, CacheType::NONE);
    m_queue->drain();
    ASSERT_EQ(m_animator->prepares, 1);

    m_orchestrator.load(request("b"));
    m_animator->finishPrepare();
    m_queue->drain();

    EXPECT_FALSE(presented(m_imageA));
    EXPECT_EQ(m_presenter->current, m_placeholder);
    ASSERT_EQ(m_log.entries.size(), 1u);
    EXPECT_EQ(m_log.entries[0].image, m_imageA);
}

TEST_F(LoadOrchestratorTest, SynchronousDiskResultIsNotAnimated) {
    useFade();
    m_orchestrator.load(request("a", WebImageOptions::QUERY_DISK_DATA_SYNC));
    m_manager->last().complete(m_imageA, CacheType::DISK);
    m_queue->drain();

    EXPECT_EQ(m_animator->prepares, 0);
    EXPECT_EQ(m_presenter->current, m_imageA);
    EXPECT_EQ(m_log.entries.size(), 1u);
}

TEST_F(LoadOrchestratorTest, ForcedTransitionAnimatesMemoryResult) {
    useFade();
    m_orchestrator.load(request("a", WebImageOptions::FORCE_TRANSITION));
    m_manager->last().complete(m_imageA, CacheType::MEMORY);
    m_queue->drain();

    EXPECT_EQ(m_animator->prepares, 1);
}

TEST_F(LoadOrchestratorTest, DetachedOwnerDropsPendingSteps) {
    m_orchestrator.load(request("a"));
    auto operation = m_manager->last().operation;

    m_registry.cancelAll(owner());
    m_store.detach(owner());
    EXPECT_EQ(operation->cancelCount(), 1);

    // Cancellation is a hint, the manager may still deliver
    m_manager->last().complete(m_imageA, CacheType::NONE);
    m_queue->drain();

    EXPECT_TRUE(m_presenter->calls.empty());
    EXPECT_TRUE(m_log.entries.empty());
}

} // namespace
} // namespace webimage
