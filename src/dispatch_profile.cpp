#include "dispatch_profile.hpp"
#include <spdlog/fmt/fmt.h>

namespace dispatch {

std::expected<Strategy, DispatchError> parse_strategy(const std::string& name) {
    if (name == kMetaWeight) return Strategy::Weight;
    if (name == kMetaRandom) return Strategy::Random;
    if (name == kMetaRoundRobin) return Strategy::RoundRobin;
    return std::unexpected(DispatchError{
        ErrorCode::UnsupportedStrategy,
        fmt::format("unsupported dispatch strategy: <{}>", name)});
}

std::string strategy_name(Strategy strategy) {
    switch (strategy) {
        case Strategy::Weight: return kMetaWeight;
        case Strategy::Random: return kMetaRandom;
        case Strategy::RoundRobin: return kMetaRoundRobin;
        default: return "Unknown";
    }
}

std::string DispatchProfile::key() const {
    return profile_key(tenant, id);
}

std::string profile_key(const std::string& tenant, const std::string& id) {
    return tenant + ":" + id;
}

} // namespace dispatch
