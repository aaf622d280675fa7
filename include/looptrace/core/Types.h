#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace looptrace {

using VertexId = uint32_t;

constexpr VertexId INVALID_VERTEX = UINT32_MAX;

/// Minimum size of a strongly connected component that can hold a cycle.
/// Size-1 components are self-loops and are never reported.
constexpr size_t MIN_SCC_SIZE = 2;

/// Whether edges carry a direction. Only directed graphs can be searched.
enum class Directedness {
    Directed,
    Undirected
};

struct VertexData {
    VertexId id = INVALID_VERTEX;
    std::string name;
    std::string type;  ///< Type tag, used only by type-limited searches

    VertexData() = default;
    VertexData(std::string n, std::string t) : name(std::move(n)), type(std::move(t)) {}
    VertexData(VertexId i, std::string n, std::string t)
        : id(i), name(std::move(n)), type(std::move(t)) {}
};

struct EdgeData {
    VertexId from = INVALID_VERTEX;
    VertexId to = INVALID_VERTEX;

    EdgeData() = default;
    EdgeData(VertexId f, VertexId t) : from(f), to(t) {}

    bool operator==(const EdgeData& o) const { return from == o.from && to == o.to; }
};

/// Elementary cycle as an ordered vertex sequence.
/// Starts at its anchor; the closing edge back to the anchor is implicit.
using Cycle = std::vector<VertexId>;

/// Strongly connected component, members in ascending id order.
using Component = std::vector<VertexId>;

}  // namespace looptrace
