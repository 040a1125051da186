/**
 * BrlsWebImage - Operation Key Resolver implementation
 */

#include "webimage/operation_key.hpp"

namespace webimage {

std::string OperationKeyResolver::resolve(const OwnerRef& owner, const std::string& explicitKey) {
    if (!explicitKey.empty()) return explicitKey;
    return defaultKey(owner);
}

std::string OperationKeyResolver::defaultKey(const OwnerRef& owner) {
    // type_info names are stable for the lifetime of the process
    return owner.type.name();
}

std::string OperationKeyResolver::keyForState(const OwnerRef& owner, ControlState state) {
    return defaultKey(owner) + "." + controlStateString(state);
}

std::string OperationKeyResolver::controlStateString(ControlState state) {
    switch (state) {
        case ControlState::NORMAL: return "normal";
        case ControlState::FOCUSED: return "focused";
        default: return "unknown";
    }
}

} // namespace webimage
