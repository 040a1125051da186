/**
 * BrlsWebImage - Supersession Token implementation
 */

#include "webimage/supersession.hpp"

namespace webimage {

SupersessionToken::SupersessionToken(const OwnerStatePtr& owner, const std::string& key, uint64_t generation)
    : m_owner(owner), m_key(key), m_generation(generation) {}

bool SupersessionToken::isCurrent() const {
    OwnerStatePtr owner = m_owner.lock();
    if (!owner || m_key.empty()) return false;
    if (owner->latestKey != m_key) return false;

    auto it = owner->loadStates.find(m_key);
    if (it == owner->loadStates.end()) return false;
    return it->second.generation == m_generation;
}

} // namespace webimage
