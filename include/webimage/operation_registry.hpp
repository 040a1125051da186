/**
 * BrlsWebImage - Operation Registry
 * Tracks the one cancellable load registered per owner key
 */

#pragma once

#include "webimage/load_state.hpp"

#include <string>

namespace webimage {

class OperationRegistry {
public:
    explicit OperationRegistry(LoadStateStore& store);

    // Registers the operation, cancelling whatever was registered at the key
    void set(const OwnerRef& owner, const std::string& key, const ImageOperationPtr& operation);

    // Cancels and forgets the key's operation. No-op when there is none.
    void cancel(const OwnerRef& owner, const std::string& key);

    // cancel() with the owner's latest key
    void cancelLatest(const OwnerRef& owner);

    // Cancels every operation of the owner (used on detach)
    void cancelAll(const OwnerRef& owner);

    // Forgets the key's operation without cancelling it
    void remove(const OwnerRef& owner, const std::string& key);

    bool has(const OwnerRef& owner, const std::string& key) const;
    ImageOperationPtr get(const OwnerRef& owner, const std::string& key) const;

private:
    LoadStateStore& m_store;
};

} // namespace webimage
