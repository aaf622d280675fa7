#pragma once

#include "looptrace/config/SearchOptions.h"

#include <chrono>
#include <string>

namespace looptrace {

struct SessionResult {
    size_t cycles = 0;
    size_t iterations = 0;
    size_t vertices = 0;
    size_t edges = 0;
    std::chrono::duration<double> elapsed{0.0};
};

/// One run of the command line tool: read the edge list, search, append
/// every cycle to the output file and log progress through Logger.
/// The output file is opened with the first cycle, so a run that finds
/// none neither creates nor touches it.
class SearchSession {
public:
    SearchSession(std::string edgesPath, std::string cyclesPath, SearchOptions options);

    /// @throws ConfigurationError, RuntimeSearchError or IOError; cycles
    ///         written before the failure stay in the output file
    SessionResult run();

    /// "12.5 (00:00:12.500000)"
    static std::string formatElapsed(std::chrono::duration<double> elapsed);

private:
    std::string edgesPath_;
    std::string cyclesPath_;
    SearchOptions options_;
};

}  // namespace looptrace
