#pragma once

#include "Types.h"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace looptrace {

class Graph {
public:
    explicit Graph(Directedness directedness = Directedness::Directed)
        : directedness_(directedness) {}

    /// Build a graph from explicit vertex and edge lists.
    /// Vertices with id == INVALID_VERTEX get the next free id, others keep theirs.
    /// @throws ConfigurationError for an undirected source, a duplicate vertex id,
    ///         or an edge naming an unknown vertex
    static Graph build(const std::vector<VertexData>& vertices,
                       const std::vector<EdgeData>& edges,
                       Directedness directedness = Directedness::Directed);

    // Vertex operations
    VertexId addVertex();
    VertexId addVertex(const std::string& name, const std::string& type = "");
    VertexId addVertex(const VertexData& data);

    // Removal API:
    // - removeVertex() on an id that is not in the graph is a no-op.
    // - Ids of the remaining vertices never change. Storage is compacted,
    //   so references returned by vertex() are invalidated.
    void removeVertex(VertexId id);
    void removeVertices(const std::vector<VertexId>& ids);
    bool hasVertex(VertexId id) const;

    // Vertex access API:
    // - vertex(): throws RuntimeSearchError for an unknown id.
    // - tryGetVertex(): returns a copy, std::nullopt for an unknown id.
    const VertexData& vertex(VertexId id) const;
    std::optional<VertexData> tryGetVertex(VertexId id) const;

    // Edge operations
    // Returns false when the edge was already present (duplicates are merged).
    // Throws ConfigurationError if either endpoint is unknown.
    bool addEdge(VertexId from, VertexId to);
    bool hasEdge(VertexId from, VertexId to) const;

    // Queries
    size_t vertexCount() const { return slots_.size(); }
    size_t edgeCount() const { return edgeCount_; }
    bool empty() const { return slots_.empty(); }

    /// All vertex ids in ascending order
    std::vector<VertexId> vertices() const;
    std::vector<EdgeData> edges() const;

    // Neighbor lists are kept sorted by ascending id, so search output is reproducible.
    // Both throw RuntimeSearchError for an unknown id.
    const std::vector<VertexId>& outNeighbors(VertexId id) const;
    const std::vector<VertexId>& inNeighbors(VertexId id) const;

    /// New graph holding only the given vertices and the edges between them.
    /// Ids, names and types are preserved.
    /// @throws RuntimeSearchError if an id is not in this graph
    Graph inducedSubgraph(const std::vector<VertexId>& ids) const;

    Directedness directedness() const { return directedness_; }
    bool isDirected() const { return directedness_ == Directedness::Directed; }

    void clear();

private:
    struct Slot {
        VertexData data;
        std::vector<VertexId> out;
        std::vector<VertexId> in;
    };

    size_t slotOf(VertexId id) const;
    Slot& slotFor(VertexId id) { return slots_[slotOf(id)]; }
    const Slot& slotFor(VertexId id) const { return slots_[slotOf(id)]; }

    Directedness directedness_;

    // Compact storage plus id -> slot indirection; ids survive compaction
    std::vector<Slot> slots_;
    std::unordered_map<VertexId, size_t> slotIndex_;

    VertexId nextVertexId_ = 0;
    size_t edgeCount_ = 0;
};

}  // namespace looptrace
