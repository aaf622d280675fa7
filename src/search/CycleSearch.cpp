#include "looptrace/search/CycleSearch.h"
#include "looptrace/algorithms/StronglyConnectedComponents.h"
#include "looptrace/core/Errors.h"

namespace looptrace {

CycleSearch::CycleSearch(Graph graph, PathLimit limit,
                         std::shared_ptr<IDiagnosticsSink> diagnostics)
    : graph_(std::move(graph))
    , limit_(std::move(limit))
    , diagnostics_(diagnostics ? std::move(diagnostics)
                               : std::make_shared<NullDiagnosticsSink>()) {
    if (!graph_.isDirected()) {
        throw ConfigurationError("Cycle search requires a directed graph");
    }

    totalVertices_ = graph_.vertexCount();
    totalEdges_ = graph_.edgeCount();

    // Vertices outside every component of MIN_SCC_SIZE or more lie on no cycle
    std::vector<Component> cyclic;
    for (auto& component : algorithms::stronglyConnectedComponents(graph_)) {
        if (component.size() >= MIN_SCC_SIZE) {
            cyclic.push_back(std::move(component));
        } else {
            graph_.removeVertices(component);
        }
    }
    pushComponents(std::move(cyclic));
}

bool CycleSearch::next(Cycle& cycle) {
    if (finished_) return false;

    while (true) {
        if (!anchorActive_ && !beginAnchor()) {
            finished_ = true;
            report(DiagnosticEvent::Kind::SearchCompleted);
            return false;
        }
        if (resumeAnchor(cycle)) {
            return true;
        }
        finishAnchor();
    }
}

void CycleSearch::pushComponents(std::vector<Component> components) {
    // Components arrive ordered by smallest member; the smallest is searched first
    for (auto it = components.rbegin(); it != components.rend(); ++it) {
        worklist_.push_back(std::move(*it));
    }
}

bool CycleSearch::beginAnchor() {
    if (worklist_.empty()) return false;

    component_ = std::move(worklist_.back());
    worklist_.pop_back();
    ++iteration_;

    anchor_ = component_.front();
    members_.clear();
    members_.insert(component_.begin(), component_.end());

    path_.clear();
    countedOnPath_ = 0;
    blocked_.clear();
    closed_.clear();
    unblockClosure_.clear();
    frames_.clear();

    pushVertex(anchor_);
    anchorActive_ = true;
    return true;
}

bool CycleSearch::resumeAnchor(Cycle& cycle) {
    while (!frames_.empty()) {
        Frame& top = frames_.back();

        if (!top.exhausted() && pathWithinLimit()) {
            VertexId next = top.neighbors[top.cursor++];
            if (next == anchor_) {
                closed_.insert(path_.begin(), path_.end());
                ++cyclesFound_;
                cycle = path_;
                report(DiagnosticEvent::Kind::CycleFound, path_);
                return true;
            }
            if (blocked_.find(next) == blocked_.end()) {
                pushVertex(next);
            }
            continue;
        }

        // Neighbors exhausted, or the limit forbids extending this path
        if (!top.exhausted()) {
            // Truncated: treated like a found cycle so no vertex on the path stays blocked
            closed_.insert(path_.begin(), path_.end());
        }

        if (closed_.find(top.node) != closed_.end()) {
            unblock(top.node);
        } else {
            for (VertexId nbr : top.neighbors) {
                unblockClosure_[nbr].insert(top.node);
            }
        }
        popVertex();
    }
    return false;
}

void CycleSearch::finishAnchor() {
    anchorActive_ = false;
    graph_.removeVertex(anchor_);

    // The anchor is the smallest member, the residual is everything after it
    Component residual(component_.begin() + 1, component_.end());
    Graph remainder = graph_.inducedSubgraph(residual);

    std::vector<Component> split;
    for (auto& part : algorithms::stronglyConnectedComponents(remainder)) {
        if (part.size() >= MIN_SCC_SIZE) {
            split.push_back(std::move(part));
        } else {
            graph_.removeVertices(part);
        }
    }
    pushComponents(std::move(split));

    report(DiagnosticEvent::Kind::ComponentProcessed);

    members_.clear();
    blocked_.clear();
    closed_.clear();
    unblockClosure_.clear();
}

void CycleSearch::pushVertex(VertexId v) {
    Frame frame;
    frame.node = v;
    frame.neighbors = componentNeighbors(v);
    frame.counted = limit_.isTyped() && limit_.counts(graph_.vertex(v));

    if (frame.counted) ++countedOnPath_;
    path_.push_back(v);
    blocked_.insert(v);
    closed_.erase(v);
    frames_.push_back(std::move(frame));
}

void CycleSearch::popVertex() {
    if (frames_.back().counted) --countedOnPath_;
    frames_.pop_back();
    path_.pop_back();
}

void CycleSearch::unblock(VertexId v) {
    std::vector<VertexId> stack{v};
    while (!stack.empty()) {
        VertexId node = stack.back();
        stack.pop_back();

        if (blocked_.erase(node) == 0) continue;

        auto it = unblockClosure_.find(node);
        if (it != unblockClosure_.end()) {
            stack.insert(stack.end(), it->second.begin(), it->second.end());
            it->second.clear();
        }
    }
}

std::vector<VertexId> CycleSearch::componentNeighbors(VertexId v) const {
    // Self-loops are skipped: a one-vertex cycle is never reported
    std::vector<VertexId> result;
    for (VertexId succ : graph_.outNeighbors(v)) {
        if (succ != v && members_.find(succ) != members_.end()) {
            result.push_back(succ);
        }
    }
    return result;
}

void CycleSearch::report(DiagnosticEvent::Kind kind, std::span<const VertexId> cycle) {
    DiagnosticEvent event;
    event.kind = kind;
    event.iteration = iteration_;
    event.cyclesFound = cyclesFound_;
    event.cycle = cycle;
    event.remainingVertices = graph_.vertexCount();
    event.totalVertices = totalVertices_;
    event.remainingEdges = graph_.edgeCount();
    event.totalEdges = totalEdges_;
    diagnostics_->record(event);
}

}  // namespace looptrace
