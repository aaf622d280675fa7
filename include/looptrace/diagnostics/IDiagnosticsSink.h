#pragma once

#include "looptrace/core/Types.h"

#include <span>
#include <string>

namespace looptrace {

/// Progress event reported by the cycle search
struct DiagnosticEvent {
    enum class Kind {
        CycleFound,          ///< `cycle` holds the cycle just emitted
        ComponentProcessed,  ///< an anchor vertex was consumed and its component re-split
        SearchCompleted      ///< every component is exhausted
    };

    Kind kind = Kind::CycleFound;
    size_t iteration = 0;    ///< 1-based anchor iteration
    size_t cyclesFound = 0;  ///< cycles emitted so far, including this one

    /// Vertices of the cycle for CycleFound. Only valid during record().
    std::span<const VertexId> cycle;

    // Graph size for ComponentProcessed / SearchCompleted
    size_t remainingVertices = 0;
    size_t totalVertices = 0;
    size_t remainingEdges = 0;
    size_t totalEdges = 0;
};

/// Receiver of search progress. Injected into CycleSearch; the search
/// itself keeps no global logging state.
class IDiagnosticsSink {
public:
    virtual ~IDiagnosticsSink() = default;

    virtual void record(const DiagnosticEvent& event) = 0;
};

/// Discards every event
class NullDiagnosticsSink : public IDiagnosticsSink {
public:
    void record(const DiagnosticEvent&) override {}
};

/// Forwards events to Logger as human readable lines
class LoggerDiagnosticsSink : public IDiagnosticsSink {
public:
    void record(const DiagnosticEvent& event) override;
};

/// Text line for an event, e.g. "3. cycle = [0, 4, 2]" or
/// "3. subgraph (10/20 vertices [50.00% processed], 12/40 edges [70.00% processed])"
std::string describeEvent(const DiagnosticEvent& event);

}  // namespace looptrace
