/**
 * BrlsWebImage - Operation Key Resolver
 * Names the logical image slot a request targets on its owner
 */

#pragma once

#include "webimage/image.hpp"

#include <string>

namespace webimage {

// Image slots of multi-state controls
enum class ControlState {
    NORMAL = 0,
    FOCUSED = 1
};

class OperationKeyResolver {
public:
    // explicitKey wins when not empty, otherwise the key is derived from the
    // owner's runtime type and is the same for every owner of that type
    static std::string resolve(const OwnerRef& owner, const std::string& explicitKey);

    static std::string defaultKey(const OwnerRef& owner);

    // "<default key>.normal", "<default key>.focused"
    static std::string keyForState(const OwnerRef& owner, ControlState state);

    static std::string controlStateString(ControlState state);
};

} // namespace webimage
