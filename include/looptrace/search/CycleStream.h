#pragma once

#include "looptrace/search/CycleSearch.h"

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>

namespace looptrace {

/// Lazy, single-pass sequence of the cycles found by a CycleSearch.
///
/// Each hasNext()/next() computes at most one further cycle. The stream is
/// finite and cannot be restarted; a second pass needs a new stream.
/// Dropping the stream before it is drained is safe.
///
/// Example:
/// @code
/// auto cycles = looptrace::simpleCycles(graph, looptrace::PathLimit(8));
/// for (const auto& cycle : cycles) {
///     writer.write(cycle);
/// }
/// @endcode
class CycleStream {
public:
    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Cycle;
        using difference_type = std::ptrdiff_t;
        using pointer = const Cycle*;
        using reference = const Cycle&;

        Iterator() = default;
        explicit Iterator(CycleStream* stream) : stream_(stream) { advance(); }

        reference operator*() const { return current_; }
        pointer operator->() const { return &current_; }

        Iterator& operator++() {
            advance();
            return *this;
        }
        void operator++(int) { advance(); }

        bool operator==(const Iterator& other) const { return stream_ == other.stream_; }

    private:
        void advance();

        CycleStream* stream_ = nullptr;  // null once exhausted
        Cycle current_;
    };

    explicit CycleStream(std::unique_ptr<CycleSearch> search);

    CycleStream(CycleStream&&) = default;
    CycleStream& operator=(CycleStream&&) = default;

    /// Whether another cycle exists. Runs the search up to that cycle.
    bool hasNext();

    /// Next cycle
    /// @throws std::out_of_range if the stream is exhausted
    Cycle next();

    Iterator begin() { return Iterator(this); }
    Iterator end() { return Iterator(); }

    const CycleSearch& search() const { return *search_; }

private:
    std::unique_ptr<CycleSearch> search_;
    std::optional<Cycle> pending_;
};

/// Stream of every elementary cycle of `graph` within `limit`.
/// The graph is copied; the caller's instance is never modified.
/// @throws ConfigurationError if the graph is undirected
CycleStream simpleCycles(const Graph& graph,
                         PathLimit limit = PathLimit::unlimited(),
                         std::shared_ptr<IDiagnosticsSink> diagnostics = nullptr);

}  // namespace looptrace
