#include "looptrace/core/Graph.h"
#include "looptrace/core/Errors.h"

#include <algorithm>

namespace looptrace {

namespace {

bool insertSorted(std::vector<VertexId>& list, VertexId id) {
    auto it = std::lower_bound(list.begin(), list.end(), id);
    if (it != list.end() && *it == id) {
        return false;
    }
    list.insert(it, id);
    return true;
}

void eraseSorted(std::vector<VertexId>& list, VertexId id) {
    auto it = std::lower_bound(list.begin(), list.end(), id);
    if (it != list.end() && *it == id) {
        list.erase(it);
    }
}

}  // namespace

Graph Graph::build(const std::vector<VertexData>& vertices,
                   const std::vector<EdgeData>& edges,
                   Directedness directedness) {
    if (directedness != Directedness::Directed) {
        throw ConfigurationError("Cycle search requires a directed graph");
    }

    Graph graph(directedness);
    for (const auto& v : vertices) {
        graph.addVertex(v);
    }
    for (const auto& e : edges) {
        graph.addEdge(e.from, e.to);
    }
    return graph;
}

VertexId Graph::addVertex() {
    return addVertex(VertexData{});
}

VertexId Graph::addVertex(const std::string& name, const std::string& type) {
    return addVertex(VertexData{name, type});
}

VertexId Graph::addVertex(const VertexData& data) {
    VertexId id = data.id;
    if (id == INVALID_VERTEX) {
        id = nextVertexId_++;
    } else if (hasVertex(id)) {
        throw ConfigurationError("Duplicate vertex ID: " + std::to_string(id));
    } else {
        nextVertexId_ = std::max(nextVertexId_, id + 1);
    }

    Slot slot;
    slot.data = data;
    slot.data.id = id;

    slotIndex_[id] = slots_.size();
    slots_.push_back(std::move(slot));
    return id;
}

void Graph::removeVertex(VertexId id) {
    auto found = slotIndex_.find(id);
    if (found == slotIndex_.end()) return;

    size_t index = found->second;
    Slot& slot = slots_[index];

    // Detach incident edges from the neighbors' adjacency lists
    bool selfLoop = std::binary_search(slot.out.begin(), slot.out.end(), id);
    for (VertexId succ : slot.out) {
        if (succ != id) eraseSorted(slotFor(succ).in, id);
    }
    for (VertexId pred : slot.in) {
        if (pred != id) eraseSorted(slotFor(pred).out, id);
    }
    edgeCount_ -= slot.out.size() + slot.in.size() - (selfLoop ? 1 : 0);

    // Compact: move the last slot into the hole
    size_t last = slots_.size() - 1;
    if (index != last) {
        slots_[index] = std::move(slots_[last]);
        slotIndex_[slots_[index].data.id] = index;
    }
    slots_.pop_back();
    slotIndex_.erase(id);
}

void Graph::removeVertices(const std::vector<VertexId>& ids) {
    for (VertexId id : ids) {
        removeVertex(id);
    }
}

bool Graph::hasVertex(VertexId id) const {
    return slotIndex_.find(id) != slotIndex_.end();
}

size_t Graph::slotOf(VertexId id) const {
    auto it = slotIndex_.find(id);
    if (it == slotIndex_.end()) {
        throw RuntimeSearchError("Invalid vertex ID: " + std::to_string(id));
    }
    return it->second;
}

const VertexData& Graph::vertex(VertexId id) const {
    return slotFor(id).data;
}

std::optional<VertexData> Graph::tryGetVertex(VertexId id) const {
    auto it = slotIndex_.find(id);
    if (it == slotIndex_.end()) {
        return std::nullopt;
    }
    return slots_[it->second].data;
}

bool Graph::addEdge(VertexId from, VertexId to) {
    if (!hasVertex(from) || !hasVertex(to)) {
        throw ConfigurationError("Invalid vertex ID in edge " + std::to_string(from) +
                                 " -> " + std::to_string(to));
    }

    if (!insertSorted(slotFor(from).out, to)) {
        return false;
    }
    insertSorted(slotFor(to).in, from);
    ++edgeCount_;
    return true;
}

bool Graph::hasEdge(VertexId from, VertexId to) const {
    auto it = slotIndex_.find(from);
    if (it == slotIndex_.end()) return false;

    const auto& out = slots_[it->second].out;
    return std::binary_search(out.begin(), out.end(), to);
}

std::vector<VertexId> Graph::vertices() const {
    std::vector<VertexId> result;
    result.reserve(slots_.size());
    for (const auto& slot : slots_) {
        result.push_back(slot.data.id);
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::vector<EdgeData> Graph::edges() const {
    std::vector<EdgeData> result;
    result.reserve(edgeCount_);
    for (VertexId from : vertices()) {
        for (VertexId to : slotFor(from).out) {
            result.emplace_back(from, to);
        }
    }
    return result;
}

const std::vector<VertexId>& Graph::outNeighbors(VertexId id) const {
    return slotFor(id).out;
}

const std::vector<VertexId>& Graph::inNeighbors(VertexId id) const {
    return slotFor(id).in;
}

Graph Graph::inducedSubgraph(const std::vector<VertexId>& ids) const {
    std::vector<VertexId> members(ids);
    std::sort(members.begin(), members.end());
    members.erase(std::unique(members.begin(), members.end()), members.end());

    Graph sub(directedness_);
    for (VertexId id : members) {
        sub.addVertex(vertex(id));
    }
    for (VertexId from : members) {
        for (VertexId to : slotFor(from).out) {
            if (sub.hasVertex(to)) {
                sub.addEdge(from, to);
            }
        }
    }
    // Fresh ids in the subgraph must not collide with ids of this graph
    sub.nextVertexId_ = nextVertexId_;
    return sub;
}

void Graph::clear() {
    slots_.clear();
    slotIndex_.clear();
    nextVertexId_ = 0;
    edgeCount_ = 0;
}

}  // namespace looptrace
