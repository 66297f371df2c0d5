#pragma once

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "core/conflict.hpp"

namespace core {

struct GraphNode {
    ProvisionId provision{};
    std::size_t conflict_count{0};
    std::set<ProvisionId> neighbours{};
    double centrality{0.0}; // degree / node count
};

struct ConflictCluster {
    std::size_t index{0};
    std::vector<ProvisionId> provisions{}; // sorted
    std::vector<ConflictId> conflicts{};   // sorted
    double priority{0.0};                  // mean severity of member conflicts
};

// Provision graph with one edge per conflict. Built from a store listing for
// reporting; not kept in sync with the store.
class ConflictGraph {
public:
    void add(const Conflict& c);
    void build(const std::vector<Conflict>& conflicts);

    std::size_t node_count() const noexcept { return nodes_.size(); }
    std::size_t edge_count() const noexcept { return edges_.size(); }
    const GraphNode* node(const ProvisionId& id) const;

    // Nodes ordered by descending centrality, then id.
    std::vector<GraphNode> most_central(std::size_t limit) const;

    // Connected components of two or more provisions, ordered by descending
    // priority.
    std::vector<ConflictCluster> clusters() const;

    // Conflicts ordered by descending severity, then id.
    std::vector<Conflict> most_severe(std::size_t limit) const;

private:
    void refresh_centrality();

    std::map<ProvisionId, GraphNode> nodes_;
    std::map<ConflictId, Conflict> edges_;
};

} // namespace core
