#include "looptrace/io/EdgeListReader.h"
#include "looptrace/core/Errors.h"

#include <algorithm>
#include <fstream>
#include <unordered_map>
#include <vector>

namespace looptrace {

namespace {

constexpr const char* UTF8_BOM = "\xEF\xBB\xBF";

std::vector<std::string> splitFields(const std::string& line, char delimiter) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (true) {
        size_t pos = line.find(delimiter, start);
        if (pos == std::string::npos) {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, pos - start));
        start = pos + 1;
    }
    return fields;
}

void stripLineEnding(std::string& line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
}

}  // namespace

EdgeListReader::EdgeListReader(EdgeListOptions options) : options_(std::move(options)) {}

Graph EdgeListReader::readFromFile(const std::string& path) const {
    std::ifstream in(path);
    if (!in) {
        throw IOError("Cannot open edge list '" + path + "'");
    }
    return readFromStream(in);
}

Graph EdgeListReader::readFromStream(std::istream& in) const {
    std::string line;
    if (!std::getline(in, line)) {
        throw ConfigurationError("Edge list is empty, a header line is required");
    }
    stripLineEnding(line);
    if (line.rfind(UTF8_BOM, 0) == 0) {
        line.erase(0, 3);
    }

    std::vector<std::string> header = splitFields(line, options_.delimiter);
    if (header.size() < 2) {
        throw ConfigurationError("Edge list header needs at least two columns: '" + line + "'");
    }

    auto sourceIt = std::find(header.begin(), header.end(), options_.sourceColumn);
    auto targetIt = std::find(header.begin(), header.end(), options_.targetColumn);
    size_t sourceCol = 0;
    size_t targetCol = 1;
    if (sourceIt != header.end() && targetIt != header.end()) {
        sourceCol = static_cast<size_t>(sourceIt - header.begin());
        targetCol = static_cast<size_t>(targetIt - header.begin());
    } else if (sourceIt != header.end() || targetIt != header.end()) {
        throw ConfigurationError("Edge list header names only one of '" + options_.sourceColumn +
                                 "' and '" + options_.targetColumn + "'");
    }
    const size_t needed = std::max(sourceCol, targetCol) + 1;

    Graph graph(Directedness::Directed);
    std::unordered_map<std::string, VertexId> interned;

    auto intern = [&](const std::string& name) {
        auto it = interned.find(name);
        if (it != interned.end()) return it->second;
        VertexId id = graph.addVertex(name, deriveType(name, options_.typeDelimiter));
        interned.emplace(name, id);
        return id;
    };

    size_t lineNumber = 1;
    while (std::getline(in, line)) {
        ++lineNumber;
        stripLineEnding(line);
        if (line.empty()) continue;

        std::vector<std::string> fields = splitFields(line, options_.delimiter);
        if (fields.size() < needed) {
            throw ConfigurationError("Edge list line " + std::to_string(lineNumber) +
                                     " has " + std::to_string(fields.size()) +
                                     " fields, expected at least " + std::to_string(needed));
        }

        const std::string& source = fields[sourceCol];
        const std::string& target = fields[targetCol];
        if (source.empty() || target.empty()) {
            throw ConfigurationError("Edge list line " + std::to_string(lineNumber) +
                                     " has an empty vertex name");
        }

        VertexId from = intern(source);
        VertexId to = intern(target);
        graph.addEdge(from, to);
    }

    if (in.bad()) {
        throw IOError("Failed reading edge list at line " + std::to_string(lineNumber));
    }
    return graph;
}

std::string EdgeListReader::deriveType(const std::string& name, char delimiter) {
    return name.substr(0, name.find(delimiter));
}

}  // namespace looptrace
