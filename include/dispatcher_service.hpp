#pragma once

#include "dispatch_error.hpp"
#include "dispatch_profile.hpp"
#include "selector.hpp"
#include <concepts>
#include <expected>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace dispatch {

// Attempt callback used by dispatch(): true when the connection served
// the request, false to fail over to the next candidate.
template<typename F>
concept ConnAttempt = std::predicate<F, const std::string&>;

class DispatcherService {
public:
    DispatcherService() = default;

    // Install or reconfigure a profile (write lock)
    std::expected<void, DispatchError> set_profile(const DispatchProfile& profile);

    // Remove a profile, false when unknown (write lock)
    bool remove_profile(const std::string& tenant, const std::string& id);

    bool has_profile(const std::string& tenant, const std::string& id) const;
    size_t profile_count() const;
    std::vector<DispatchProfile> profiles() const;

    // Request-scoped instance of the profile's selector (read lock)
    std::expected<std::unique_ptr<Selector>, DispatchError>
    get_instance(const std::string& tenant, const std::string& id) const;

    // Try candidates in selector order until one attempt succeeds.
    // Returns the connection that served the request.
    template<ConnAttempt Attempt>
    std::expected<std::string, DispatchError>
    dispatch(const std::string& tenant, const std::string& id, Attempt&& attempt) const {
        auto instance = get_instance(tenant, id);
        if (!instance.has_value()) {
            return std::unexpected(instance.error());
        }

        auto& selector = instance.value();
        size_t max_conns = selector->max_conns();
        for (size_t i = 0; i < max_conns; ++i) {
            std::string conn_id = selector->next_conn_id();
            if (attempt(conn_id)) {
                return conn_id;
            }
            log_failover(tenant, id, conn_id);
        }

        return std::unexpected(DispatchError{
            ErrorCode::NoConnectionAvailable,
            "all " + std::to_string(max_conns) + " connections failed for profile " +
                profile_key(tenant, id)});
    }

private:
    struct Entry {
        DispatchProfile profile;
        std::shared_ptr<Selector> selector;
    };

    static void log_failover(const std::string& tenant, const std::string& id,
                             const std::string& conn_id);

    std::map<std::string, Entry> entries_;
    mutable std::shared_mutex mutex_;
};

} // namespace dispatch
