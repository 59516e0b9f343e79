#include "connection_pool.hpp"
#include <algorithm>

namespace dispatch {

ConnectionPool::ConnectionPool(std::vector<ConnectionDescriptor> conns)
    : conns_(std::move(conns)) {}

void ConnectionPool::sort() {
    std::stable_sort(conns_.begin(), conns_.end(),
        [](const ConnectionDescriptor& a, const ConnectionDescriptor& b) {
            return a.weight > b.weight;
        });
}

ConnectionPool ConnectionPool::sorted_clone() const {
    ConnectionPool clone(conns_);
    clone.sort();
    return clone;
}

std::vector<std::string> ConnectionPool::ids() const {
    std::vector<std::string> result;
    result.reserve(conns_.size());
    for (const auto& conn : conns_) {
        result.push_back(conn.id);
    }
    return result;
}

bool ConnectionPool::contains(const std::string& id) const {
    return std::any_of(conns_.begin(), conns_.end(),
        [&id](const ConnectionDescriptor& conn) { return conn.id == id; });
}

void ConnectionPool::add(const std::string& id, double weight) {
    conns_.push_back(ConnectionDescriptor{id, weight});
}

} // namespace dispatch
