#pragma once

#include <optional>
#include <string>
#include <vector>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <mutex>
#include <cstdint>

// Dependency graph between resources. hops() may throw when the backing
// service is unavailable; the topology strategy then skips the pair.
class TopologyProvider {
public:
    virtual ~TopologyProvider() = default;

    // Shortest path length between two resources, or nullopt if unreachable
    // within max_hops
    virtual std::optional<uint32_t> hops(const std::string& resource_a,
                                         const std::string& resource_b,
                                         uint32_t max_hops) = 0;
};

// Undirected graph loaded from configuration
class StaticTopologyProvider : public TopologyProvider {
public:
    StaticTopologyProvider() = default;
    explicit StaticTopologyProvider(const std::vector<std::pair<std::string, std::string>>& edges);

    void add_edge(const std::string& a, const std::string& b);

    std::optional<uint32_t> hops(const std::string& resource_a,
                                 const std::string& resource_b,
                                 uint32_t max_hops) override;

    size_t node_count() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::unordered_set<std::string>> adjacency_;
};
