#include "selector_factory.hpp"
#include "logger.hpp"
#include <spdlog/fmt/fmt.h>

namespace dispatch {

std::expected<std::unique_ptr<Selector>, DispatchError>
SelectorFactory::construct(const DispatchProfile& profile) {
    auto strategy = parse_strategy(profile.strategy);
    if (!strategy.has_value()) {
        Logger::error(Logger::Component::Factory,
            fmt::format("Profile {}: {}", profile.key(), strategy.error().message));
        return std::unexpected(strategy.error());
    }

    if (profile.connections.empty()) {
        Logger::error(Logger::Component::Factory,
            fmt::format("Profile {} has no connections", profile.key()));
        return std::unexpected(DispatchError{
            ErrorCode::EmptyPool,
            fmt::format("profile {} has no connections", profile.key())});
    }

    ConnectionPool pool = profile.connections.sorted_clone();

    std::unique_ptr<Selector> selector;
    switch (strategy.value()) {
        case Strategy::Weight:
            selector = std::make_unique<WeightSelector>(std::move(pool));
            break;
        case Strategy::Random:
            selector = std::make_unique<RandomSelector>(std::move(pool));
            break;
        case Strategy::RoundRobin:
            selector = std::make_unique<RoundRobinSelector>(std::move(pool));
            break;
    }

    Logger::info(Logger::Component::Factory,
        fmt::format("Constructed {} selector for profile {} ({} connections)",
            profile.strategy, profile.key(), profile.connections.size()));
    return selector;
}

std::vector<std::string> SelectorFactory::supported_strategies() {
    return {kMetaWeight, kMetaRandom, kMetaRoundRobin};
}

} // namespace dispatch
