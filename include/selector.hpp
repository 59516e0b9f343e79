#pragma once

#include "connection_pool.hpp"
#include "dispatch_error.hpp"
#include "dispatch_profile.hpp"
#include <cstdint>
#include <expected>
#include <memory>
#include <random>
#include <shared_mutex>
#include <string>

namespace dispatch {

// Strategy contract. A long-lived selector is kept per profile and
// reconfigured through set_profile; each request draws its own instance
// through get_instance and calls next_conn_id on it for failover order.
class Selector {
public:
    virtual ~Selector() = default;

    // Replace the pool with a sorted clone of the profile's connections
    // and reset the rotation. Empty pools are rejected, state unchanged.
    virtual std::expected<void, DispatchError> set_profile(const DispatchProfile& profile) = 0;

    // Independent copy for a single request, no state shared with this one
    virtual std::unique_ptr<Selector> get_instance() = 0;

    // Connection at the cursor, then advance the cursor with wraparound.
    // Throws PreconditionViolation on an empty pool.
    virtual std::string next_conn_id() = 0;

    virtual size_t max_conns() const = 0;

    virtual Strategy strategy() const = 0;
};

struct RotationState {
    ConnectionPool pool;
    size_t cursor = 0;
};

// Common pool + cursor handling. The state is guarded by mutex_:
// writers (set_profile, next_conn_id) take it exclusively.
class PoolSelector : public Selector {
public:
    std::expected<void, DispatchError> set_profile(const DispatchProfile& profile) override;
    std::string next_conn_id() override;
    size_t max_conns() const override;

protected:
    explicit PoolSelector(ConnectionPool pool);

    RotationState state_;
    mutable std::shared_mutex mutex_;
};

// Ordered rotation over the weight-sorted pool; every instance starts
// from the highest weight connection.
class WeightSelector : public PoolSelector {
public:
    explicit WeightSelector(ConnectionPool sorted_pool);

    std::unique_ptr<Selector> get_instance() override;
    Strategy strategy() const override { return Strategy::Weight; }
};

// Every instance walks the pool once in its own shuffled order.
class RandomSelector : public PoolSelector {
public:
    explicit RandomSelector(ConnectionPool sorted_pool);
    RandomSelector(ConnectionPool sorted_pool, uint64_t seed);

    std::unique_ptr<Selector> get_instance() override;
    Strategy strategy() const override { return Strategy::Random; }

private:
    std::mt19937_64 rng_;
};

// Each new instance starts one connection further than the previous one,
// so first attempts are spread evenly across the pool.
class RoundRobinSelector : public PoolSelector {
public:
    explicit RoundRobinSelector(ConnectionPool sorted_pool);

    std::unique_ptr<Selector> get_instance() override;
    Strategy strategy() const override { return Strategy::RoundRobin; }
};

} // namespace dispatch
