#pragma once

#include "looptrace/core/Graph.h"
#include "looptrace/core/Types.h"

#include <fstream>
#include <optional>
#include <span>
#include <string>

namespace looptrace {

/// Rendering of one cycle per output line
enum class CycleFormat {
    Ids,       ///< [0, 5, 3]
    Names,     ///< [A-1, B-7, A-3]; names are not escaped, use JsonLines for names with ", " or "]"
    JsonLines  ///< ["A-1","B-7","A-3"]
};

const char* cycleFormatName(CycleFormat format);
std::optional<CycleFormat> parseCycleFormat(const std::string& name);

/// Append-only destination for discovered cycles.
///
/// Every record is flushed as soon as it is written, so the file holds all
/// cycles found so far even if the run is interrupted.
class CycleWriter {
public:
    /// Opens `path` for appending.
    /// @param graph Source of vertex names; required for Names and JsonLines.
    ///        Must outlive the writer.
    /// @throws IOError if the file cannot be opened
    /// @throws ConfigurationError if a name format is requested without a graph
    CycleWriter(const std::string& path, CycleFormat format, const Graph* graph = nullptr);

    CycleWriter(const CycleWriter&) = delete;
    CycleWriter& operator=(const CycleWriter&) = delete;

    /// @throws IOError if the write fails
    void write(const Cycle& cycle);

    size_t recordsWritten() const { return recordsWritten_; }
    const std::string& path() const { return path_; }

    /// Render a cycle as one line (without the trailing newline)
    static std::string render(std::span<const VertexId> cycle, CycleFormat format,
                              const Graph* graph = nullptr);

private:
    std::string path_;
    CycleFormat format_;
    const Graph* graph_;
    std::ofstream out_;
    size_t recordsWritten_ = 0;
};

}  // namespace looptrace
