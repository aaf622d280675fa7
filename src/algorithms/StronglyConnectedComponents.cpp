#include "looptrace/algorithms/StronglyConnectedComponents.h"

#include <algorithm>
#include <limits>
#include <unordered_map>

namespace looptrace {
namespace algorithms {

std::vector<Component> stronglyConnectedComponents(const Graph& graph, size_t minSize) {
    const std::vector<VertexId> ids = graph.vertices();
    const size_t n = ids.size();

    // Dense local index for every vertex id
    std::unordered_map<VertexId, size_t> local;
    local.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        local[ids[i]] = i;
    }

    constexpr size_t NOT_VISITED = std::numeric_limits<size_t>::max();
    std::vector<size_t> order(n, NOT_VISITED);
    std::vector<size_t> lowLink(n, 0);
    std::vector<bool> onStack(n, false);
    std::vector<size_t> sccStack;
    size_t nextOrder = 0;

    // DFS frame: local vertex index and position in its successor list
    struct Frame {
        size_t node;
        size_t next;
    };
    std::vector<Frame> dfsStack;

    std::vector<Component> result;

    auto visit = [&](size_t v) {
        order[v] = lowLink[v] = nextOrder++;
        sccStack.push_back(v);
        onStack[v] = true;
        dfsStack.push_back({v, 0});
    };

    for (size_t start = 0; start < n; ++start) {
        if (order[start] != NOT_VISITED) continue;

        visit(start);
        while (!dfsStack.empty()) {
            size_t node = dfsStack.back().node;
            const auto& successors = graph.outNeighbors(ids[node]);

            if (dfsStack.back().next < successors.size()) {
                size_t succ = local.at(successors[dfsStack.back().next++]);
                if (order[succ] == NOT_VISITED) {
                    visit(succ);
                } else if (onStack[succ]) {
                    lowLink[node] = std::min(lowLink[node], order[succ]);
                }
                continue;
            }

            // Post-visit
            dfsStack.pop_back();
            if (!dfsStack.empty()) {
                size_t parent = dfsStack.back().node;
                lowLink[parent] = std::min(lowLink[parent], lowLink[node]);
            }

            if (lowLink[node] == order[node]) {
                Component component;
                while (true) {
                    size_t top = sccStack.back();
                    sccStack.pop_back();
                    onStack[top] = false;
                    component.push_back(ids[top]);
                    if (top == node) break;
                }
                if (component.size() >= minSize) {
                    std::sort(component.begin(), component.end());
                    result.push_back(std::move(component));
                }
            }
        }
    }

    std::sort(result.begin(), result.end(),
              [](const Component& a, const Component& b) { return a.front() < b.front(); });
    return result;
}

}  // namespace algorithms
}  // namespace looptrace
