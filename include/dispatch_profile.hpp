#pragma once

#include "connection_pool.hpp"
#include "dispatch_error.hpp"
#include <expected>
#include <string>
#include <vector>

namespace dispatch {

enum class Strategy {
    Weight,
    Random,
    RoundRobin
};

// Recognized strategy names
inline constexpr const char* kMetaWeight = "*weight";
inline constexpr const char* kMetaRandom = "*random";
inline constexpr const char* kMetaRoundRobin = "*round_robin";

std::expected<Strategy, DispatchError> parse_strategy(const std::string& name);
std::string strategy_name(Strategy strategy);

struct DispatchProfile {
    std::string tenant;
    std::string id;
    std::string strategy;
    double weight = 0;
    ConnectionPool connections;

    // Key under which the profile is registered, "tenant:id"
    std::string key() const;
};

std::string profile_key(const std::string& tenant, const std::string& id);

} // namespace dispatch
