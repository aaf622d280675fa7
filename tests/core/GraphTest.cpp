#include <gtest/gtest.h>
#include <looptrace/core/Errors.h>
#include <looptrace/core/Graph.h>

#include <algorithm>

using namespace looptrace;

TEST(GraphTest, AddVertex) {
    Graph graph;
    VertexId id = graph.addVertex();

    EXPECT_TRUE(graph.hasVertex(id));
    EXPECT_EQ(graph.vertexCount(), 1u);
}

TEST(GraphTest, AddVertexWithNameAndType) {
    Graph graph;
    VertexId id = graph.addVertex("person-7", "person");

    EXPECT_EQ(graph.vertex(id).name, "person-7");
    EXPECT_EQ(graph.vertex(id).type, "person");
    EXPECT_EQ(graph.vertex(id).id, id);
}

TEST(GraphTest, IdsAreSequential) {
    Graph graph;
    EXPECT_EQ(graph.addVertex(), 0u);
    EXPECT_EQ(graph.addVertex(), 1u);
    EXPECT_EQ(graph.addVertex(), 2u);
}

TEST(GraphTest, AddEdgeDeduplicates) {
    Graph graph;
    VertexId a = graph.addVertex();
    VertexId b = graph.addVertex();

    EXPECT_TRUE(graph.addEdge(a, b));
    EXPECT_FALSE(graph.addEdge(a, b));
    EXPECT_EQ(graph.edgeCount(), 1u);
    EXPECT_TRUE(graph.hasEdge(a, b));
    EXPECT_FALSE(graph.hasEdge(b, a));
}

TEST(GraphTest, AddEdgeWithUnknownVertexThrows) {
    Graph graph;
    VertexId a = graph.addVertex();

    EXPECT_THROW(graph.addEdge(a, 42), ConfigurationError);
    EXPECT_THROW(graph.addEdge(42, a), ConfigurationError);
}

TEST(GraphTest, OutNeighborsAreAscending) {
    Graph graph;
    for (int i = 0; i < 5; ++i) graph.addVertex();

    graph.addEdge(0, 4);
    graph.addEdge(0, 2);
    graph.addEdge(0, 3);
    graph.addEdge(0, 1);

    std::vector<VertexId> expected{1, 2, 3, 4};
    EXPECT_EQ(graph.outNeighbors(0), expected);

    std::vector<VertexId> preds{0};
    EXPECT_EQ(graph.inNeighbors(3), preds);
}

TEST(GraphTest, NeighborsOfUnknownVertexThrow) {
    Graph graph;
    graph.addVertex();

    EXPECT_THROW(graph.outNeighbors(9), RuntimeSearchError);
    EXPECT_THROW(graph.inNeighbors(9), RuntimeSearchError);
    EXPECT_THROW(graph.vertex(9), RuntimeSearchError);
    EXPECT_FALSE(graph.tryGetVertex(9).has_value());
}

TEST(GraphTest, RemoveVertexDropsIncidentEdges) {
    Graph graph;
    VertexId a = graph.addVertex("a");
    VertexId b = graph.addVertex("b");
    VertexId c = graph.addVertex("c");
    graph.addEdge(a, b);
    graph.addEdge(b, c);
    graph.addEdge(c, a);
    graph.addEdge(b, b);

    graph.removeVertex(b);

    EXPECT_FALSE(graph.hasVertex(b));
    EXPECT_EQ(graph.vertexCount(), 2u);
    EXPECT_EQ(graph.edgeCount(), 1u);
    EXPECT_TRUE(graph.outNeighbors(a).empty());
    EXPECT_TRUE(graph.inNeighbors(c).empty());
    EXPECT_TRUE(graph.hasEdge(c, a));
}

TEST(GraphTest, RemoveVertexKeepsOtherIdsStable) {
    Graph graph;
    for (int i = 0; i < 4; ++i) graph.addVertex("n" + std::to_string(i));
    graph.addEdge(3, 1);

    // Removing the first slot moves the last one into its place
    graph.removeVertex(0);

    EXPECT_EQ(graph.vertex(3).name, "n3");
    EXPECT_EQ(graph.vertex(1).name, "n1");
    EXPECT_TRUE(graph.hasEdge(3, 1));

    std::vector<VertexId> expected{1, 2, 3};
    EXPECT_EQ(graph.vertices(), expected);

    // Ids are never reused
    EXPECT_EQ(graph.addVertex(), 4u);
}

TEST(GraphTest, RemoveUnknownVertexIsNoOp) {
    Graph graph;
    graph.addVertex();

    EXPECT_NO_THROW(graph.removeVertex(17));
    EXPECT_EQ(graph.vertexCount(), 1u);
}

TEST(GraphTest, InducedSubgraphKeepsIdsAndInternalEdges) {
    Graph graph;
    for (int i = 0; i < 5; ++i) graph.addVertex("n" + std::to_string(i), "t" + std::to_string(i % 2));
    graph.addEdge(0, 1);
    graph.addEdge(1, 3);
    graph.addEdge(3, 1);
    graph.addEdge(3, 4);
    graph.addEdge(4, 0);

    Graph sub = graph.inducedSubgraph({3, 1, 4});

    std::vector<VertexId> expected{1, 3, 4};
    EXPECT_EQ(sub.vertices(), expected);
    EXPECT_EQ(sub.edgeCount(), 3u);
    EXPECT_TRUE(sub.hasEdge(1, 3));
    EXPECT_TRUE(sub.hasEdge(3, 1));
    EXPECT_TRUE(sub.hasEdge(3, 4));
    EXPECT_FALSE(sub.hasVertex(0));
    EXPECT_EQ(sub.vertex(4).name, "n4");
    EXPECT_EQ(sub.vertex(3).type, "t1");

    // The source graph is unchanged
    EXPECT_EQ(graph.vertexCount(), 5u);
    EXPECT_EQ(graph.edgeCount(), 5u);

    // New vertices in the subgraph do not reuse ids of the source graph
    EXPECT_EQ(sub.addVertex(), 5u);
}

TEST(GraphTest, InducedSubgraphOfUnknownVertexThrows) {
    Graph graph;
    graph.addVertex();

    EXPECT_THROW(graph.inducedSubgraph({0, 5}), RuntimeSearchError);
}

TEST(GraphTest, BuildFromLists) {
    std::vector<VertexData> vertices{{"a", "x"}, {"b", "y"}, {"c", "x"}};
    std::vector<EdgeData> edges{{0, 1}, {1, 2}, {2, 0}, {2, 0}};

    Graph graph = Graph::build(vertices, edges);

    EXPECT_TRUE(graph.isDirected());
    EXPECT_EQ(graph.vertexCount(), 3u);
    EXPECT_EQ(graph.edgeCount(), 3u);
    EXPECT_EQ(graph.vertex(2).name, "c");

    std::vector<EdgeData> expected{{0, 1}, {1, 2}, {2, 0}};
    EXPECT_EQ(graph.edges(), expected);
}

TEST(GraphTest, BuildKeepsExplicitIds) {
    std::vector<VertexData> vertices{{10, "a", ""}, {3, "b", ""}};
    Graph graph = Graph::build(vertices, {{10, 3}});

    EXPECT_TRUE(graph.hasEdge(10, 3));
    EXPECT_EQ(graph.addVertex(), 11u);
    EXPECT_THROW(Graph::build({{1, "a", ""}, {1, "b", ""}}, {}), ConfigurationError);
}

TEST(GraphTest, BuildRejectsUndirectedSource) {
    EXPECT_THROW(Graph::build({{"a", ""}, {"b", ""}}, {{0, 1}}, Directedness::Undirected),
                 ConfigurationError);
}

TEST(GraphTest, Clear) {
    Graph graph;
    VertexId a = graph.addVertex();
    VertexId b = graph.addVertex();
    graph.addEdge(a, b);

    graph.clear();

    EXPECT_TRUE(graph.empty());
    EXPECT_EQ(graph.edgeCount(), 0u);
    EXPECT_FALSE(graph.hasVertex(a));
}
