#pragma once

#include "looptrace/core/Graph.h"
#include "looptrace/core/Types.h"

#include <vector>

namespace looptrace {
namespace algorithms {

/// Partition the vertices of a graph into strongly connected components.
///
/// Non-recursive Tarjan, O(V + E). Every vertex belongs to exactly one
/// component before filtering; components smaller than minSize are dropped.
/// Members of each component are in ascending id order and the components
/// are ordered by their smallest member, so the result depends only on the
/// graph's contents.
///
/// @param graph The input graph
/// @param minSize Minimum component size to keep (1 keeps every component)
std::vector<Component> stronglyConnectedComponents(const Graph& graph, size_t minSize = 1);

}  // namespace algorithms
}  // namespace looptrace
