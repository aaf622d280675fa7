#pragma once

#include "looptrace/core/Types.h"

#include <optional>
#include <string>

namespace looptrace {

/// Bound on the paths explored by the cycle search.
///
/// - length < 0: unrestricted
/// - length >= 0, no type: a path may hold at most `length` vertices
/// - length >= 0, type set: a path may hold at most `length` vertices whose
///   type tag equals `type`; vertices of other types are not counted
struct PathLimit {
    int length = -1;
    std::optional<std::string> type;

    PathLimit() = default;
    explicit PathLimit(int len, std::optional<std::string> t = std::nullopt)
        : length(len), type(std::move(t)) {}

    static PathLimit unlimited() { return PathLimit{}; }

    /// Parse the textual length limit (surrounding whitespace allowed).
    /// @throws ConfigurationError if the text is not an integer
    static PathLimit parse(const std::string& lengthText,
                           std::optional<std::string> type = std::nullopt);

    bool isUnlimited() const { return length < 0; }
    bool isTyped() const { return type.has_value(); }

    /// Whether a vertex counts against the limit
    bool counts(const VertexData& vertex) const {
        return !type || vertex.type == *type;
    }

    /// Whether a path with `pathLength` vertices, `countedVertices` of which
    /// count against the limit, may still be extended
    bool allows(size_t pathLength, size_t countedVertices) const {
        if (length < 0) return true;
        size_t used = type ? countedVertices : pathLength;
        return used <= static_cast<size_t>(length);
    }

    std::string toString() const;
};

}  // namespace looptrace
