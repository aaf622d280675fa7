#include <gtest/gtest.h>
#include <looptrace/algorithms/StronglyConnectedComponents.h>

#include "../support/CycleOracle.h"

#include <map>
#include <set>

using namespace looptrace;
using looptrace::algorithms::stronglyConnectedComponents;

namespace {

Graph graphWith(size_t n, const std::vector<EdgeData>& edges) {
    Graph graph;
    for (size_t i = 0; i < n; ++i) graph.addVertex();
    for (const auto& e : edges) graph.addEdge(e.from, e.to);
    return graph;
}

bool reaches(const Graph& graph, VertexId from, VertexId to) {
    std::set<VertexId> seen{from};
    std::vector<VertexId> stack{from};
    while (!stack.empty()) {
        VertexId v = stack.back();
        stack.pop_back();
        if (v == to) return true;
        for (VertexId w : graph.outNeighbors(v)) {
            if (seen.insert(w).second) stack.push_back(w);
        }
    }
    return false;
}

}  // namespace

TEST(StronglyConnectedComponentsTest, EmptyGraph) {
    Graph graph;
    EXPECT_TRUE(stronglyConnectedComponents(graph).empty());
}

TEST(StronglyConnectedComponentsTest, SingleCycle) {
    Graph graph = graphWith(3, {{0, 1}, {1, 2}, {2, 0}});

    auto sccs = stronglyConnectedComponents(graph);

    ASSERT_EQ(sccs.size(), 1u);
    EXPECT_EQ(sccs[0], (Component{0, 1, 2}));
}

TEST(StronglyConnectedComponentsTest, ChainGivesSingletons) {
    Graph graph = graphWith(3, {{0, 1}, {1, 2}});

    auto sccs = stronglyConnectedComponents(graph);

    ASSERT_EQ(sccs.size(), 3u);
    EXPECT_EQ(sccs[0], (Component{0}));
    EXPECT_EQ(sccs[1], (Component{1}));
    EXPECT_EQ(sccs[2], (Component{2}));
}

TEST(StronglyConnectedComponentsTest, MinSizeFiltersSelfLoops) {
    Graph graph = graphWith(4, {{0, 0}, {1, 2}, {2, 1}, {3, 1}});

    auto all = stronglyConnectedComponents(graph);
    auto filtered = stronglyConnectedComponents(graph, MIN_SCC_SIZE);

    EXPECT_EQ(all.size(), 3u);
    ASSERT_EQ(filtered.size(), 1u);
    EXPECT_EQ(filtered[0], (Component{1, 2}));
}

TEST(StronglyConnectedComponentsTest, TwoComponentsJoinedByBridge) {
    // {0,1,2} -> {3,4}
    Graph graph = graphWith(5, {{0, 1}, {1, 2}, {2, 0}, {2, 3}, {3, 4}, {4, 3}});

    auto sccs = stronglyConnectedComponents(graph, MIN_SCC_SIZE);

    ASSERT_EQ(sccs.size(), 2u);
    EXPECT_EQ(sccs[0], (Component{0, 1, 2}));
    EXPECT_EQ(sccs[1], (Component{3, 4}));
}

TEST(StronglyConnectedComponentsTest, WorksAfterVertexRemoval) {
    Graph graph = graphWith(4, {{0, 1}, {1, 2}, {2, 3}, {3, 0}, {2, 1}});
    graph.removeVertex(0);

    auto sccs = stronglyConnectedComponents(graph, MIN_SCC_SIZE);

    ASSERT_EQ(sccs.size(), 1u);
    EXPECT_EQ(sccs[0], (Component{1, 2}));
}

TEST(StronglyConnectedComponentsTest, DeepChainDoesNotRecurse) {
    const size_t n = 200000;
    Graph graph;
    for (size_t i = 0; i < n; ++i) graph.addVertex();
    for (VertexId i = 0; i + 1 < n; ++i) graph.addEdge(i, i + 1);
    graph.addEdge(static_cast<VertexId>(n - 1), 0);

    auto sccs = stronglyConnectedComponents(graph);

    ASSERT_EQ(sccs.size(), 1u);
    EXPECT_EQ(sccs[0].size(), n);
}

TEST(StronglyConnectedComponentsTest, MatchesMutualReachabilityOnRandomGraphs) {
    for (uint32_t seed = 1; seed <= 20; ++seed) {
        Graph graph = looptrace::oracle::randomGraph(seed, 9, 0.2);
        auto sccs = stronglyConnectedComponents(graph);

        // Partition of all vertices
        std::set<VertexId> covered;
        for (const auto& scc : sccs) {
            for (VertexId v : scc) EXPECT_TRUE(covered.insert(v).second) << "seed " << seed;
        }
        EXPECT_EQ(covered.size(), graph.vertexCount()) << "seed " << seed;

        // Same component <=> mutually reachable
        std::map<VertexId, size_t> componentOf;
        for (size_t i = 0; i < sccs.size(); ++i) {
            for (VertexId v : sccs[i]) componentOf[v] = i;
        }
        for (VertexId a : graph.vertices()) {
            for (VertexId b : graph.vertices()) {
                bool mutual = reaches(graph, a, b) && reaches(graph, b, a);
                EXPECT_EQ(componentOf[a] == componentOf[b], mutual)
                    << "seed " << seed << " vertices " << a << ", " << b;
            }
        }
    }
}
