/**
 * BrlsWebImage - Load State Store
 * Owner-scoped side-table of per-key load states
 *
 * Owners never carry fields for image loading. Everything the core knows about
 * an owner lives in an OwnerState entry keyed by the owner's address. The entry
 * never points back at the owner, and deferred work only keeps a weak_ptr to
 * it, so a detached owner silently drops all pending steps.
 *
 * The store is not locked: it is only touched from the owner's home context
 * (the borealis main thread). Progress counters are the one piece of state
 * written from fetch threads, and they are atomics.
 */

#pragma once

#include "webimage/image.hpp"
#include "webimage/image_manager.hpp"
#include "webimage/indicator.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <typeindex>
#include <unordered_map>

namespace webimage {

struct ImageTransition;

// Written to both counters when a load finishes without reporting any progress
const int64_t PROGRESS_UNIT_COUNT_UNKNOWN = 1;

class Progress {
public:
    int64_t totalUnitCount() const { return m_totalUnitCount.load(); }
    int64_t completedUnitCount() const { return m_completedUnitCount.load(); }

    void setTotalUnitCount(int64_t count) { m_totalUnitCount.store(count); }
    void setCompletedUnitCount(int64_t count) { m_completedUnitCount.store(count); }

    void reset();
    void markUnknownComplete();

    // Hands the counters to the request issued as generation and resets them.
    // Samples from any other request are ignored from then on.
    void claim(uint64_t generation);
    bool isOwnedBy(uint64_t generation) const { return m_generation.load() == generation; }

    bool isReset() const;
    bool isUnknownComplete() const;

    // 0.0 - 1.0, 0 while the total is unknown
    double fractionCompleted() const;

private:
    std::atomic<int64_t> m_totalUnitCount{0};
    std::atomic<int64_t> m_completedUnitCount{0};
    std::atomic<uint64_t> m_generation{0};
};

using ProgressPtr = std::shared_ptr<Progress>;

struct LoadState {
    std::string url;        // Last url requested for the key, empty when none
    ProgressPtr progress;   // Kept across requests on the same key
    uint64_t generation = 0;  // Issue number of the request that wrote this state
};

struct OwnerState {
    explicit OwnerState(std::type_index ownerType) : type(ownerType) {}

    std::type_index type;
    std::string latestKey;
    std::map<std::string, LoadState> loadStates;
    std::map<std::string, ImageOperationPtr> operations;
    ImageIndicatorPtr indicator;
    std::shared_ptr<ImageTransition> transition;
    uint64_t lastGeneration = 0;
};

using OwnerStatePtr = std::shared_ptr<OwnerState>;

class LoadStateStore {
public:
    LoadStateStore() = default;
    LoadStateStore(const LoadStateStore&) = delete;
    LoadStateStore& operator=(const LoadStateStore&) = delete;

    // Store used by ImageLoader
    static LoadStateStore& getInstance();

    // Entry for the owner, created on first use
    OwnerStatePtr acquire(const OwnerRef& owner);

    // Entry for the owner, null if it has none
    OwnerStatePtr find(const OwnerRef& owner) const;

    std::optional<LoadState> get(const OwnerRef& owner, const std::string& key) const;
    void set(const OwnerRef& owner, const std::string& key, const LoadState& state);
    void remove(const OwnerRef& owner, const std::string& key);

    // Release the owner's whole entry. Callers cancel its operations first.
    void detach(const OwnerRef& owner);

    size_t ownerCount() const { return m_owners.size(); }

    // Accessors for the owner's latest key
    std::string latestKey(const OwnerRef& owner) const;
    std::string imageUrl(const OwnerRef& owner) const;
    ProgressPtr imageProgress(const OwnerRef& owner);
    void setImageProgress(const OwnerRef& owner, const ProgressPtr& progress);

private:
    std::unordered_map<const void*, OwnerStatePtr> m_owners;
};

} // namespace webimage
