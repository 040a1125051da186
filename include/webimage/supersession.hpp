/**
 * BrlsWebImage - Supersession Token
 * Tells deferred steps whether their request is still the one that counts
 */

#pragma once

#include "webimage/load_state.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace webimage {

class SupersessionToken {
public:
    SupersessionToken() = default;
    SupersessionToken(const OwnerStatePtr& owner, const std::string& key, uint64_t generation);

    // The owner is still attached, its latest key is still this request's key
    // and no newer request was issued for that key
    bool isCurrent() const;

    // The owner is still attached
    bool isOwnerAlive() const { return !m_owner.expired(); }

    OwnerStatePtr lockOwner() const { return m_owner.lock(); }

    const std::string& key() const { return m_key; }
    uint64_t generation() const { return m_generation; }

private:
    std::weak_ptr<OwnerState> m_owner;
    std::string m_key;
    uint64_t m_generation = 0;
};

} // namespace webimage
