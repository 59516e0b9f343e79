#include "selector.hpp"
#include "logger.hpp"
#include <algorithm>
#include <mutex>
#include <spdlog/fmt/fmt.h>

namespace dispatch {

PoolSelector::PoolSelector(ConnectionPool pool) {
    state_.pool = std::move(pool);
    state_.cursor = 0;
}

std::expected<void, DispatchError> PoolSelector::set_profile(const DispatchProfile& profile) {
    auto parsed = parse_strategy(profile.strategy);
    if (!parsed.has_value()) {
        return std::unexpected(parsed.error());
    }
    if (parsed.value() != strategy()) {
        return std::unexpected(DispatchError{
            ErrorCode::InvalidProfile,
            fmt::format("profile {} changes strategy from {} to {}",
                profile.key(), strategy_name(strategy()), profile.strategy)});
    }
    if (profile.connections.empty()) {
        return std::unexpected(DispatchError{
            ErrorCode::EmptyPool,
            fmt::format("profile {} has no connections", profile.key())});
    }

    ConnectionPool sorted = profile.connections.sorted_clone();
    {
        std::unique_lock lock(mutex_);
        state_.pool = std::move(sorted);
        state_.cursor = 0;
    }

    Logger::debug(Logger::Component::Selector,
        fmt::format("Profile {} applied with {} connections",
            profile.key(), profile.connections.size()));
    return {};
}

std::string PoolSelector::next_conn_id() {
    std::unique_lock lock(mutex_);
    if (state_.pool.empty()) {
        throw PreconditionViolation("next_conn_id called on an empty connection pool");
    }
    if (state_.cursor >= state_.pool.size()) {
        throw PreconditionViolation(fmt::format(
            "rotation cursor {} out of range for pool of {}",
            state_.cursor, state_.pool.size()));
    }

    std::string conn_id = state_.pool[state_.cursor].id;
    state_.cursor++;
    if (state_.cursor == state_.pool.size()) {
        state_.cursor = 0; // start from beginning
    }
    return conn_id;
}

size_t PoolSelector::max_conns() const {
    std::shared_lock lock(mutex_);
    return state_.pool.size();
}

WeightSelector::WeightSelector(ConnectionPool sorted_pool)
    : PoolSelector(std::move(sorted_pool)) {}

std::unique_ptr<Selector> WeightSelector::get_instance() {
    std::shared_lock lock(mutex_);
    return std::make_unique<WeightSelector>(state_.pool);
}

RandomSelector::RandomSelector(ConnectionPool sorted_pool)
    : PoolSelector(std::move(sorted_pool)), rng_(std::random_device{}()) {}

RandomSelector::RandomSelector(ConnectionPool sorted_pool, uint64_t seed)
    : PoolSelector(std::move(sorted_pool)), rng_(seed) {}

std::unique_ptr<Selector> RandomSelector::get_instance() {
    std::vector<ConnectionDescriptor> conns;
    uint64_t seed;
    {
        // rng_ is advanced, so the lock is exclusive
        std::unique_lock lock(mutex_);
        conns.assign(state_.pool.begin(), state_.pool.end());
        std::shuffle(conns.begin(), conns.end(), rng_);
        seed = rng_();
    }
    return std::make_unique<RandomSelector>(ConnectionPool(std::move(conns)), seed);
}

RoundRobinSelector::RoundRobinSelector(ConnectionPool sorted_pool)
    : PoolSelector(std::move(sorted_pool)) {}

std::unique_ptr<Selector> RoundRobinSelector::get_instance() {
    std::vector<ConnectionDescriptor> conns;
    {
        std::unique_lock lock(mutex_);
        conns.assign(state_.pool.begin(), state_.pool.end());
        if (!conns.empty()) {
            std::rotate(conns.begin(), conns.begin() + state_.cursor, conns.end());
            state_.cursor = (state_.cursor + 1) % state_.pool.size();
        }
    }
    return std::make_unique<RoundRobinSelector>(ConnectionPool(std::move(conns)));
}

} // namespace dispatch
