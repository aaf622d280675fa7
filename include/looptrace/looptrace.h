#pragma once

/// @file looptrace.h
/// @brief Main header for the looptrace cycle enumeration library
///
/// looptrace lists every elementary cycle of a directed graph, optionally
/// bounded by path length or by the number of vertices of one type.
///
/// Example usage:
/// @code
/// #include <looptrace/looptrace.h>
///
/// looptrace::Graph graph;
/// auto a = graph.addVertex("person-1", "person");
/// auto b = graph.addVertex("company-7", "company");
/// graph.addEdge(a, b);
/// graph.addEdge(b, a);
///
/// for (const auto& cycle : looptrace::simpleCycles(graph)) {
///     // cycle == {a, b}
/// }
/// @endcode

// Core module - graph data structures
#include "core/Types.h"
#include "core/Errors.h"
#include "core/Graph.h"

// Algorithms
#include "algorithms/StronglyConnectedComponents.h"

// Search module - cycle enumeration
#include "diagnostics/IDiagnosticsSink.h"
#include "search/PathLimit.h"
#include "search/CycleSearch.h"
#include "search/CycleStream.h"

// I/O and configuration
#include "io/EdgeListReader.h"
#include "io/CycleWriter.h"
#include "config/SearchOptions.h"

namespace looptrace {

/// Library version
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

/// Get version as string (computed from constants)
inline std::string versionString() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

}  // namespace looptrace
