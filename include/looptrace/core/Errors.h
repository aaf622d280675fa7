#pragma once

#include <stdexcept>
#include <string>

namespace looptrace {

/// Invalid input detected before a search starts: undirected graph,
/// non-integer length limit, malformed edge list or options.
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what) : std::invalid_argument(what) {}
};

/// Internal invariant violation during a search, e.g. a vertex id that
/// is no longer present in the graph. Aborts the run.
class RuntimeSearchError : public std::runtime_error {
public:
    explicit RuntimeSearchError(const std::string& what) : std::runtime_error(what) {}
};

/// Failure reading the edge list or writing cycles.
class IOError : public std::runtime_error {
public:
    explicit IOError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace looptrace
