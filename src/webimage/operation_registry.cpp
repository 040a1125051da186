/**
 * BrlsWebImage - Operation Registry implementation
 */

#include "webimage/operation_registry.hpp"

#include <borealis.hpp>

namespace webimage {

OperationRegistry::OperationRegistry(LoadStateStore& store) : m_store(store) {}

void OperationRegistry::set(const OwnerRef& owner, const std::string& key, const ImageOperationPtr& operation) {
    if (key.empty()) return;

    // Cancel first so two loads never own the key at once
    cancel(owner, key);

    if (!operation) return;
    OwnerStatePtr state = m_store.acquire(owner);
    if (!state) return;
    state->operations[key] = operation;
}

void OperationRegistry::cancel(const OwnerRef& owner, const std::string& key) {
    OwnerStatePtr state = m_store.find(owner);
    if (!state || key.empty()) return;

    auto it = state->operations.find(key);
    if (it == state->operations.end()) return;

    ImageOperationPtr operation = it->second;
    state->operations.erase(it);
    if (operation && !operation->isCancelled()) {
        brls::Logger::debug("OperationRegistry: Cancelling load for key {}", key);
        operation->cancel();
    }
}

void OperationRegistry::cancelLatest(const OwnerRef& owner) {
    cancel(owner, m_store.latestKey(owner));
}

void OperationRegistry::cancelAll(const OwnerRef& owner) {
    OwnerStatePtr state = m_store.find(owner);
    if (!state) return;

    auto operations = std::move(state->operations);
    state->operations.clear();
    for (auto& entry : operations) {
        if (entry.second && !entry.second->isCancelled()) {
            entry.second->cancel();
        }
    }
}

void OperationRegistry::remove(const OwnerRef& owner, const std::string& key) {
    OwnerStatePtr state = m_store.find(owner);
    if (!state) return;
    state->operations.erase(key);
}

bool OperationRegistry::has(const OwnerRef& owner, const std::string& key) const {
    return get(owner, key) != nullptr;
}

ImageOperationPtr OperationRegistry::get(const OwnerRef& owner, const std::string& key) const {
    OwnerStatePtr state = m_store.find(owner);
    if (!state) return nullptr;

    auto it = state->operations.find(key);
    return it != state->operations.end() ? it->second : nullptr;
}

} // namespace webimage
