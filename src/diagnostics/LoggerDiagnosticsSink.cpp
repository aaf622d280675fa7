#include "looptrace/diagnostics/IDiagnosticsSink.h"
#include "looptrace/common/Logger.h"
#include "looptrace/io/CycleWriter.h"

#include <format>

namespace looptrace {

namespace {

double processedPercent(size_t remaining, size_t total) {
    if (total == 0) return 100.0;
    return (1.0 - static_cast<double>(remaining) / static_cast<double>(total)) * 100.0;
}

}  // namespace

std::string describeEvent(const DiagnosticEvent& event) {
    switch (event.kind) {
        case DiagnosticEvent::Kind::CycleFound:
            return std::format("{}. cycle = {}", event.iteration,
                               CycleWriter::render(event.cycle, CycleFormat::Ids));
        case DiagnosticEvent::Kind::ComponentProcessed:
            return std::format(
                "{}. subgraph ({}/{} vertices [{:.2f}% processed], {}/{} edges [{:.2f}% processed])",
                event.iteration,
                event.remainingVertices, event.totalVertices,
                processedPercent(event.remainingVertices, event.totalVertices),
                event.remainingEdges, event.totalEdges,
                processedPercent(event.remainingEdges, event.totalEdges));
        case DiagnosticEvent::Kind::SearchCompleted:
            return std::format("search completed: {} cycles in {} iterations",
                               event.cyclesFound, event.iteration);
    }
    return {};
}

void LoggerDiagnosticsSink::record(const DiagnosticEvent& event) {
    LOG_INFO("{}", describeEvent(event));
}

}  // namespace looptrace
