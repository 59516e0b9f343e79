#include "dispatcher_service.hpp"
#include "logger.hpp"
#include "selector_factory.hpp"
#include <mutex>
#include <spdlog/fmt/fmt.h>

namespace dispatch {

std::expected<void, DispatchError> DispatcherService::set_profile(const DispatchProfile& profile) {
    auto strategy = parse_strategy(profile.strategy);
    if (!strategy.has_value()) {
        return std::unexpected(strategy.error());
    }

    std::unique_lock lock(mutex_);
    auto it = entries_.find(profile.key());

    // Same strategy: reconfigure the live selector in place
    if (it != entries_.end() && it->second.selector->strategy() == strategy.value()) {
        auto applied = it->second.selector->set_profile(profile);
        if (!applied.has_value()) {
            return applied;
        }
        it->second.profile = profile;
        Logger::info(Logger::Component::Service,
            fmt::format("Reconfigured profile {} ({} connections)",
                profile.key(), profile.connections.size()));
        return {};
    }

    auto selector = SelectorFactory::construct(profile);
    if (!selector.has_value()) {
        return std::unexpected(selector.error());
    }

    if (it != entries_.end()) {
        Logger::info(Logger::Component::Service,
            fmt::format("Replacing selector for profile {}: {} -> {}",
                profile.key(), it->second.profile.strategy, profile.strategy));
        it->second = Entry{profile, std::move(selector.value())};
    } else {
        entries_.emplace(profile.key(), Entry{profile, std::move(selector.value())});
        Logger::info(Logger::Component::Service,
            fmt::format("Installed profile {}", profile.key()));
    }
    return {};
}

bool DispatcherService::remove_profile(const std::string& tenant, const std::string& id) {
    std::unique_lock lock(mutex_);
    bool removed = entries_.erase(profile_key(tenant, id)) > 0;
    if (removed) {
        Logger::info(Logger::Component::Service,
            fmt::format("Removed profile {}", profile_key(tenant, id)));
    }
    return removed;
}

bool DispatcherService::has_profile(const std::string& tenant, const std::string& id) const {
    std::shared_lock lock(mutex_);
    return entries_.contains(profile_key(tenant, id));
}

size_t DispatcherService::profile_count() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

std::vector<DispatchProfile> DispatcherService::profiles() const {
    std::shared_lock lock(mutex_);
    std::vector<DispatchProfile> result;
    result.reserve(entries_.size());
    for (const auto& [key, entry] : entries_) {
        result.push_back(entry.profile);
    }
    return result;
}

std::expected<std::unique_ptr<Selector>, DispatchError>
DispatcherService::get_instance(const std::string& tenant, const std::string& id) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(profile_key(tenant, id));
    if (it == entries_.end()) {
        return std::unexpected(DispatchError{
            ErrorCode::ProfileNotFound,
            fmt::format("no dispatcher profile {}", profile_key(tenant, id))});
    }
    return it->second.selector->get_instance();
}

void DispatcherService::log_failover(const std::string& tenant, const std::string& id,
                                     const std::string& conn_id) {
    Logger::warn(Logger::Component::Service,
        fmt::format("Profile {}: connection {} failed, trying next",
            profile_key(tenant, id), conn_id));
}

} // namespace dispatch
