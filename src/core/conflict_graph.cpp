#include "core/conflict_graph.hpp"

#include <algorithm>
#include <utility>

namespace core {

void ConflictGraph::add(const Conflict& c) {
    if (!edges_.emplace(c.id, c).second) {
        return;
    }
    GraphNode& a = nodes_[c.pair.a];
    a.provision = c.pair.a;
    ++a.conflict_count;
    a.neighbours.insert(c.pair.b);

    GraphNode& b = nodes_[c.pair.b];
    b.provision = c.pair.b;
    ++b.conflict_count;
    b.neighbours.insert(c.pair.a);

    refresh_centrality();
}

void ConflictGraph::build(const std::vector<Conflict>& conflicts) {
    for (const auto& c : conflicts) {
        add(c);
    }
}

void ConflictGraph::refresh_centrality() {
    const double total = static_cast<double>(std::max<std::size_t>(1, nodes_.size()));
    for (auto& [id, n] : nodes_) {
        n.centrality = static_cast<double>(n.neighbours.size()) / total;
    }
}

const GraphNode* ConflictGraph::node(const ProvisionId& id) const {
    auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : &it->second;
}

std::vector<GraphNode> ConflictGraph::most_central(std::size_t limit) const {
    std::vector<GraphNode> out;
    out.reserve(nodes_.size());
    for (const auto& [id, n] : nodes_) {
        out.push_back(n);
    }
    std::stable_sort(out.begin(), out.end(),
                     [](const GraphNode& x, const GraphNode& y) { return x.centrality > y.centrality; });
    if (out.size() > limit) {
        out.resize(limit);
    }
    return out;
}

std::vector<ConflictCluster> ConflictGraph::clusters() const {
    std::vector<ConflictCluster> out;
    std::set<ProvisionId> visited;

    for (const auto& [start, unused] : nodes_) {
        if (visited.count(start)) {
            continue;
        }
        ConflictCluster cluster{};
        std::vector<ProvisionId> stack{start};
        while (!stack.empty()) {
            ProvisionId cur = std::move(stack.back());
            stack.pop_back();
            if (!visited.insert(cur).second) {
                continue;
            }
            for (const auto& next : nodes_.at(cur).neighbours) {
                if (!visited.count(next)) {
                    stack.push_back(next);
                }
            }
            cluster.provisions.push_back(std::move(cur));
        }
        if (cluster.provisions.size() < 2) {
            continue;
        }
        std::sort(cluster.provisions.begin(), cluster.provisions.end());

        double total = 0.0;
        for (const auto& [id, c] : edges_) {
            if (std::binary_search(cluster.provisions.begin(), cluster.provisions.end(), c.pair.a)) {
                cluster.conflicts.push_back(id);
                total += c.severity;
            }
        }
        if (!cluster.conflicts.empty()) {
            cluster.priority = total / static_cast<double>(cluster.conflicts.size());
        }
        out.push_back(std::move(cluster));
    }

    std::stable_sort(out.begin(), out.end(),
                     [](const ConflictCluster& x, const ConflictCluster& y) { return x.priority > y.priority; });
    for (std::size_t i = 0; i < out.size(); ++i) {
        out[i].index = i;
    }
    return out;
}

std::vector<Conflict> ConflictGraph::most_severe(std::size_t limit) const {
    std::vector<Conflict> out;
    out.reserve(edges_.size());
    for (const auto& [id, c] : edges_) {
        out.push_back(c);
    }
    std::stable_sort(out.begin(), out.end(),
                     [](const Conflict& x, const Conflict& y) { return x.severity > y.severity; });
    if (out.size() > limit) {
        out.resize(limit);
    }
    return out;
}

} // namespace core
