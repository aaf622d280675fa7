#pragma once

#include <looptrace/core/Graph.h>

#include <algorithm>
#include <random>
#include <set>
#include <string>
#include <vector>

namespace looptrace::oracle {

/// Rotate a cycle so that its smallest vertex comes first
inline Cycle canonical(Cycle cycle) {
    auto smallest = std::min_element(cycle.begin(), cycle.end());
    std::rotate(cycle.begin(), smallest, cycle.end());
    return cycle;
}

/// Every elementary cycle of length >= 2 by exhaustive DFS, each starting
/// at its smallest vertex. Exponential; small graphs only.
inline std::set<Cycle> bruteForceCycles(const Graph& graph) {
    std::set<Cycle> result;
    std::vector<VertexId> ids = graph.vertices();

    for (VertexId start : ids) {
        Cycle path{start};
        std::vector<VertexId> onPath{start};

        // Only extend through vertices larger than start so each cycle is found once
        auto extend = [&](auto& self, VertexId node) -> void {
            for (VertexId next : graph.outNeighbors(node)) {
                if (next == start) {
                    if (path.size() >= 2) result.insert(path);
                    continue;
                }
                if (next < start) continue;
                if (std::find(path.begin(), path.end(), next) != path.end()) continue;
                path.push_back(next);
                self(self, next);
                path.pop_back();
            }
        };
        extend(extend, start);
    }
    return result;
}

/// Random directed graph with `n` vertices; self-loops included.
/// Vertex i gets type "A" when even, "B" when odd.
inline Graph randomGraph(uint32_t seed, size_t n, double edgeProbability) {
    std::mt19937 rng(seed);
    std::bernoulli_distribution edge(edgeProbability);

    Graph graph;
    for (size_t i = 0; i < n; ++i) {
        graph.addVertex("v-" + std::to_string(i), (i % 2 == 0) ? "A" : "B");
    }
    for (VertexId from = 0; from < n; ++from) {
        for (VertexId to = 0; to < n; ++to) {
            if (edge(rng)) graph.addEdge(from, to);
        }
    }
    return graph;
}

/// Number of vertices of `type` in a cycle
inline size_t countType(const Graph& graph, const Cycle& cycle, const std::string& type) {
    return static_cast<size_t>(std::count_if(cycle.begin(), cycle.end(), [&](VertexId v) {
        return graph.vertex(v).type == type;
    }));
}

}  // namespace looptrace::oracle
