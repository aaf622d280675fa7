#include "looptrace/search/CycleStream.h"

#include <stdexcept>

namespace looptrace {

void CycleStream::Iterator::advance() {
    if (stream_ && stream_->hasNext()) {
        current_ = stream_->next();
    } else {
        stream_ = nullptr;
    }
}

CycleStream::CycleStream(std::unique_ptr<CycleSearch> search)
    : search_(std::move(search)) {}

bool CycleStream::hasNext() {
    if (!pending_) {
        Cycle cycle;
        if (search_->next(cycle)) {
            pending_ = std::move(cycle);
        }
    }
    return pending_.has_value();
}

Cycle CycleStream::next() {
    if (!hasNext()) {
        throw std::out_of_range("Cycle stream is exhausted");
    }
    Cycle cycle = std::move(*pending_);
    pending_.reset();
    return cycle;
}

CycleStream simpleCycles(const Graph& graph, PathLimit limit,
                         std::shared_ptr<IDiagnosticsSink> diagnostics) {
    return CycleStream(std::make_unique<CycleSearch>(graph, std::move(limit), std::move(diagnostics)));
}

}  // namespace looptrace
