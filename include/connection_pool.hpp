#pragma once

#include <string>
#include <vector>
#include <cstddef>

namespace dispatch {

struct ConnectionDescriptor {
    std::string id;
    double weight;
};

class ConnectionPool {
public:
    ConnectionPool() = default;
    explicit ConnectionPool(std::vector<ConnectionDescriptor> conns);

    // Stable sort, highest weight first; declaration order breaks ties
    void sort();

    // Deep copy of this pool in canonical order, source left untouched
    ConnectionPool sorted_clone() const;

    std::vector<std::string> ids() const;
    bool contains(const std::string& id) const;

    const ConnectionDescriptor& operator[](size_t index) const { return conns_[index]; }
    size_t size() const { return conns_.size(); }
    bool empty() const { return conns_.empty(); }

    std::vector<ConnectionDescriptor>::const_iterator begin() const { return conns_.begin(); }
    std::vector<ConnectionDescriptor>::const_iterator end() const { return conns_.end(); }

    void add(const std::string& id, double weight);

private:
    std::vector<ConnectionDescriptor> conns_;
};

} // namespace dispatch
