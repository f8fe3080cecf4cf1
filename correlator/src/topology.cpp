#include "topology.hpp"
#include <deque>

StaticTopologyProvider::StaticTopologyProvider(const std::vector<std::pair<std::string, std::string>>& edges) {
    for (const auto& edge : edges) {
        add_edge(edge.first, edge.second);
    }
}

void StaticTopologyProvider::add_edge(const std::string& a, const std::string& b) {
    if (a.empty() || b.empty() || a == b) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    adjacency_[a].insert(b);
    adjacency_[b].insert(a);
}

std::optional<uint32_t> StaticTopologyProvider::hops(const std::string& resource_a,
                                                     const std::string& resource_b,
                                                     uint32_t max_hops) {
    if (resource_a.empty() || resource_b.empty()) {
        return std::nullopt;
    }
    if (resource_a == resource_b) {
        return 0u;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (adjacency_.find(resource_a) == adjacency_.end()) {
        return std::nullopt;
    }

    // Breadth-first search bounded by max_hops
    std::unordered_set<std::string> visited{resource_a};
    std::deque<std::pair<std::string, uint32_t>> frontier{{resource_a, 0u}};

    while (!frontier.empty()) {
        auto [node, depth] = frontier.front();
        frontier.pop_front();
        if (depth >= max_hops) {
            continue;
        }

        auto it = adjacency_.find(node);
        if (it == adjacency_.end()) {
            continue;
        }
        for (const auto& next : it->second) {
            if (next == resource_b) {
                return depth + 1;
            }
            if (visited.insert(next).second) {
                frontier.emplace_back(next, depth + 1);
            }
        }
    }

    return std::nullopt;
}

size_t StaticTopologyProvider::node_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return adjacency_.size();
}
