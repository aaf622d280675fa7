#pragma once

#include "looptrace/core/Graph.h"
#include "looptrace/core/Types.h"
#include "looptrace/diagnostics/IDiagnosticsSink.h"
#include "looptrace/search/PathLimit.h"

#include <memory>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace looptrace {

/// Enumerates the elementary cycles of a directed graph.
///
/// Nonrecursive Johnson's algorithm over strongly connected components.
/// Components wait on a worklist; for the component on top, its smallest
/// vertex becomes the anchor and a depth-first search with an explicit frame
/// stack reports every cycle through the anchor. The anchor is then deleted
/// and the rest of its component is split into sub-components again: those
/// with at least MIN_SCC_SIZE vertices go back on the worklist, the others
/// are deleted. Each cycle is therefore reported exactly once, starting at
/// the first of its vertices to be chosen as an anchor.
///
/// The search is resumable: next() runs only until the next cycle is found.
/// It works on its own copy of the graph, so abandoning it at any point
/// leaves the caller's graph untouched.
class CycleSearch {
public:
    /// @throws ConfigurationError if the graph is undirected
    explicit CycleSearch(Graph graph,
                         PathLimit limit = PathLimit::unlimited(),
                         std::shared_ptr<IDiagnosticsSink> diagnostics = nullptr);

    CycleSearch(const CycleSearch&) = delete;
    CycleSearch& operator=(const CycleSearch&) = delete;

    /// Advance to the next cycle.
    /// @param cycle Receives the cycle when one is found
    /// @return false once every component has been exhausted
    /// @throws RuntimeSearchError on a dangling vertex id
    bool next(Cycle& cycle);

    bool finished() const { return finished_; }
    size_t cyclesFound() const { return cyclesFound_; }

    /// Number of anchor vertices started so far
    size_t iterations() const { return iteration_; }

    /// Components still waiting on the worklist
    size_t pendingComponents() const { return worklist_.size(); }

    const PathLimit& limit() const { return limit_; }

    /// The shrinking working graph
    const Graph& residualGraph() const { return graph_; }

private:
    struct Frame {
        VertexId node;
        std::vector<VertexId> neighbors;  ///< successors inside the current component
        size_t cursor = 0;                ///< next neighbor to try
        bool counted = false;             ///< node counts against a typed limit

        bool exhausted() const { return cursor >= neighbors.size(); }
    };

    void pushComponents(std::vector<Component> components);
    bool beginAnchor();
    bool resumeAnchor(Cycle& cycle);
    void finishAnchor();

    void pushVertex(VertexId v);
    void popVertex();
    void unblock(VertexId v);
    std::vector<VertexId> componentNeighbors(VertexId v) const;
    bool pathWithinLimit() const { return limit_.allows(path_.size(), countedOnPath_); }
    void report(DiagnosticEvent::Kind kind, std::span<const VertexId> cycle = {});

    Graph graph_;
    PathLimit limit_;
    std::shared_ptr<IDiagnosticsSink> diagnostics_;

    size_t totalVertices_ = 0;
    size_t totalEdges_ = 0;

    // Components still to search; the back is searched next
    std::vector<Component> worklist_;

    // State of the current anchor iteration
    bool anchorActive_ = false;
    VertexId anchor_ = INVALID_VERTEX;
    Component component_;
    std::unordered_set<VertexId> members_;
    std::vector<VertexId> path_;
    size_t countedOnPath_ = 0;
    std::unordered_set<VertexId> blocked_;
    std::unordered_set<VertexId> closed_;
    std::unordered_map<VertexId, std::unordered_set<VertexId>> unblockClosure_;  // Johnson's B
    std::vector<Frame> frames_;

    size_t iteration_ = 0;
    size_t cyclesFound_ = 0;
    bool finished_ = false;
};

}  // namespace looptrace
