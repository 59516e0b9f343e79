#pragma once

#include "dispatch_error.hpp"
#include "dispatch_profile.hpp"
#include "selector.hpp"
#include <expected>
#include <memory>
#include <string>
#include <vector>

namespace dispatch {

class SelectorFactory {
public:
    // Validate the profile and build the selector for its strategy.
    // The profile is copied, never modified or retained.
    static std::expected<std::unique_ptr<Selector>, DispatchError>
    construct(const DispatchProfile& profile);

    static std::vector<std::string> supported_strategies();
};

} // namespace dispatch
