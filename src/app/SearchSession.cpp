#include "looptrace/app/SearchSession.h"
#include "looptrace/common/Logger.h"
#include "looptrace/diagnostics/IDiagnosticsSink.h"
#include "looptrace/io/CycleWriter.h"
#include "looptrace/io/EdgeListReader.h"
#include "looptrace/search/CycleStream.h"

#include <cmath>
#include <format>
#include <optional>

namespace looptrace {

SearchSession::SearchSession(std::string edgesPath, std::string cyclesPath, SearchOptions options)
    : edgesPath_(std::move(edgesPath))
    , cyclesPath_(std::move(cyclesPath))
    , options_(std::move(options)) {}

SessionResult SearchSession::run() {
    auto start = std::chrono::steady_clock::now();
    SessionResult result;

    EdgeListReader reader;
    Graph graph = reader.readFromFile(edgesPath_);
    result.vertices = graph.vertexCount();
    result.edges = graph.edgeCount();
    LOG_INFO("graph built ({} vertices, {} edges)", result.vertices, result.edges);

    PathLimit limit = options_.pathLimit();
    LOG_DEBUG("cycle limit: {}", limit.toString());

    // Opened on the first cycle; a run without cycles leaves no output file
    std::optional<CycleWriter> writer;
    auto cycles = simpleCycles(graph, limit, std::make_shared<LoggerDiagnosticsSink>());
    for (const auto& cycle : cycles) {
        if (!writer) {
            writer.emplace(cyclesPath_, options_.format, &graph);
        }
        writer->write(cycle);
    }

    result.cycles = cycles.search().cyclesFound();
    result.iterations = cycles.search().iterations();
    result.elapsed = std::chrono::steady_clock::now() - start;

    LOG_INFO("TOTAL = {} cycles", result.cycles);
    LOG_INFO("Processing finished!");
    LOG_INFO("Elapsed time: {}", formatElapsed(result.elapsed));
    Logger::flush();
    return result;
}

std::string SearchSession::formatElapsed(std::chrono::duration<double> elapsed) {
    double total = elapsed.count();
    auto micros = static_cast<long long>(std::llround(total * 1e6));

    long long hours = micros / 3600000000LL;
    long long mins = (micros / 60000000LL) % 60;
    long long secs = (micros / 1000000LL) % 60;
    long long fraction = micros % 1000000LL;

    return std::format("{} ({:02}:{:02}:{:02}.{:06})", total, hours, mins, secs, fraction);
}

}  // namespace looptrace
