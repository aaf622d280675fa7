#pragma once

#include "looptrace/core/Graph.h"

#include <istream>
#include <string>

namespace looptrace {

/// Layout of a delimited edge-list file
struct EdgeListOptions {
    char delimiter = ';';
    std::string sourceColumn = "source";
    std::string targetColumn = "target";
    char typeDelimiter = '-';  ///< type tag = name prefix before the first typeDelimiter
};

/// Reads a directed graph from a delimited edge list.
///
/// The first line is a header. The endpoint columns are found by name
/// (`source` / `target` by default), falling back to the first two columns
/// when the header names neither. Further columns are ignored, fields are
/// not unquoted and a UTF-8 byte order mark is skipped.
///
/// Vertex ids are assigned in order of first appearance, reading each row's
/// source before its target. Duplicate rows collapse into one edge.
class EdgeListReader {
public:
    explicit EdgeListReader(EdgeListOptions options = {});

    /// @throws IOError if the file cannot be opened
    /// @throws ConfigurationError for a malformed header or row
    Graph readFromFile(const std::string& path) const;

    /// @throws ConfigurationError for a malformed header or row
    Graph readFromStream(std::istream& in) const;

    /// Type tag of a vertex name: "person-42" -> "person", "plain" -> "plain"
    static std::string deriveType(const std::string& name, char delimiter = '-');

private:
    EdgeListOptions options_;
};

}  // namespace looptrace
