#include "looptrace/io/CycleWriter.h"
#include "looptrace/core/Errors.h"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace looptrace {

const char* cycleFormatName(CycleFormat format) {
    switch (format) {
        case CycleFormat::Ids: return "ids";
        case CycleFormat::Names: return "names";
        case CycleFormat::JsonLines: return "jsonl";
    }
    return "ids";
}

std::optional<CycleFormat> parseCycleFormat(const std::string& name) {
    if (name == "ids") return CycleFormat::Ids;
    if (name == "names") return CycleFormat::Names;
    if (name == "jsonl" || name == "json") return CycleFormat::JsonLines;
    return std::nullopt;
}

CycleWriter::CycleWriter(const std::string& path, CycleFormat format, const Graph* graph)
    : path_(path), format_(format), graph_(graph) {
    if (format_ != CycleFormat::Ids && graph_ == nullptr) {
        throw ConfigurationError(std::string("Cycle format '") + cycleFormatName(format_) +
                                 "' needs the graph for vertex names");
    }

    out_.open(path_, std::ios::out | std::ios::app);
    if (!out_) {
        throw IOError("Cannot open cycle output '" + path_ + "'");
    }
}

void CycleWriter::write(const Cycle& cycle) {
    out_ << render(cycle, format_, graph_) << '\n';
    out_.flush();
    if (!out_) {
        throw IOError("Failed writing cycle to '" + path_ + "'");
    }
    ++recordsWritten_;
}

std::string CycleWriter::render(std::span<const VertexId> cycle, CycleFormat format,
                                const Graph* graph) {
    if (format != CycleFormat::Ids && graph == nullptr) {
        throw ConfigurationError("Rendering vertex names needs a graph");
    }

    if (format == CycleFormat::JsonLines) {
        json names = json::array();
        for (VertexId id : cycle) {
            names.push_back(graph->vertex(id).name);
        }
        return names.dump();
    }

    std::string line = "[";
    for (size_t i = 0; i < cycle.size(); ++i) {
        if (i > 0) line += ", ";
        if (format == CycleFormat::Names) {
            line += graph->vertex(cycle[i]).name;
        } else {
            line += std::to_string(cycle[i]);
        }
    }
    line += "]";
    return line;
}

}  // namespace looptrace
