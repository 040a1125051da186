/**
 * BrlsWebImage - Load State Store implementation
 */

#include "webimage/load_state.hpp"

#include <borealis.hpp>

namespace webimage {

void Progress::reset() {
    m_totalUnitCount.store(0);
    m_completedUnitCount.store(0);
}

void Progress::markUnknownComplete() {
    m_totalUnitCount.store(PROGRESS_UNIT_COUNT_UNKNOWN);
    m_completedUnitCount.store(PROGRESS_UNIT_COUNT_UNKNOWN);
}

void Progress::claim(uint64_t generation) {
    m_generation.store(generation);
    reset();
}

bool Progress::isReset() const {
    return totalUnitCount() == 0 && completedUnitCount() == 0;
}

bool Progress::isUnknownComplete() const {
    return totalUnitCount() == PROGRESS_UNIT_COUNT_UNKNOWN &&
           completedUnitCount() == PROGRESS_UNIT_COUNT_UNKNOWN;
}

double Progress::fractionCompleted() const {
    int64_t total = totalUnitCount();
    if (total <= 0) return 0.0;
    double fraction = (double)completedUnitCount() / (double)total;
    if (fraction < 0.0) return 0.0;
    if (fraction > 1.0) return 1.0;
    return fraction;
}

LoadStateStore& LoadStateStore::getInstance() {
    static LoadStateStore instance;
    return instance;
}

OwnerStatePtr LoadStateStore::acquire(const OwnerRef& owner) {
    if (!owner.valid()) return nullptr;

    auto it = m_owners.find(owner.id);
    if (it != m_owners.end()) {
        if (it->second->type == owner.type) {
            return it->second;
        }

        // A new object lives at the address of one that never detached
        brls::Logger::warning("LoadStateStore: Owner {} reused by {} without detach, dropping stale state",
                              owner.id, owner.type.name());
        for (auto& entry : it->second->operations) {
            if (entry.second) entry.second->cancel();
        }
        m_owners.erase(it);
    }

    auto state = std::make_shared<OwnerState>(owner.type);
    m_owners[owner.id] = state;
    return state;
}

OwnerStatePtr LoadStateStore::find(const OwnerRef& owner) const {
    auto it = m_owners.find(owner.id);
    if (it == m_owners.end() || it->second->type != owner.type) return nullptr;
    return it->second;
}

std::optional<LoadState> LoadStateStore::get(const OwnerRef& owner, const std::string& key) const {
    OwnerStatePtr state = find(owner);
    if (!state || key.empty()) return std::nullopt;

    auto it = state->loadStates.find(key);
    if (it == state->loadStates.end()) return std::nullopt;
    return it->second;
}

void LoadStateStore::set(const OwnerRef& owner, const std::string& key, const LoadState& loadState) {
    if (key.empty()) return;
    OwnerStatePtr state = acquire(owner);
    if (!state) return;
    state->loadStates[key] = loadState;
}

void LoadStateStore::remove(const OwnerRef& owner, const std::string& key) {
    OwnerStatePtr state = find(owner);
    if (!state) return;
    state->loadStates.erase(key);
}

void LoadStateStore::detach(const OwnerRef& owner) {
    auto it = m_owners.find(owner.id);
    if (it == m_owners.end()) return;
    brls::Logger::debug("LoadStateStore: Detached owner {} ({} keys)", owner.id,
                        it->second->loadStates.size());
    m_owners.erase(it);
}

std::string LoadStateStore::latestKey(const OwnerRef& owner) const {
    OwnerStatePtr state = find(owner);
    return state ? state->latestKey : std::string();
}

std::string LoadStateStore::imageUrl(const OwnerRef& owner) const {
    auto loadState = get(owner, latestKey(owner));
    return loadState ? loadState->url : std::string();
}

ProgressPtr LoadStateStore::imageProgress(const OwnerRef& owner) {
    OwnerStatePtr state = acquire(owner);
    if (!state) return nullptr;

    LoadState& loadState = state->loadStates[state->latestKey];
    if (!loadState.progress) {
        loadState.progress = std::make_shared<Progress>();
    }
    return loadState.progress;
}

void LoadStateStore::setImageProgress(const OwnerRef& owner, const ProgressPtr& progress) {
    if (!progress) return;
    OwnerStatePtr state = acquire(owner);
    if (!state) return;
    state->loadStates[state->latestKey].progress = progress;
}

} // namespace webimage
