#pragma once

#include "looptrace/config/SearchOptions.h"

#include <optional>
#include <string>
#include <vector>

namespace looptrace {

/// Raw command line values, before validation
struct CommandLineArgs {
    std::string edgesPath;
    std::string cyclesPath;
    std::optional<std::string> limitLength;
    std::optional<std::string> limitType;
    std::optional<std::string> format;
    std::optional<std::string> configPath;
    std::optional<std::string> logLevel;

    /// "<cyclesPath>.log"
    std::string logFile() const { return cyclesPath + ".log"; }
};

/// Command line of the looptrace tool:
///
///   looptrace <edges.csv> <cycles.txt> [<limit_length> [<limit_type>]]
///             [--format ids|names|jsonl] [--config options.json] [--log-level level]
class CommandLine {
public:
    /// Exit status when required arguments are missing
    static constexpr int USAGE_EXIT_CODE = 255;

    /// @return std::nullopt when the two required positionals are missing
    /// @throws ConfigurationError for an unknown flag, a flag without value,
    ///         or too many positionals
    static std::optional<CommandLineArgs> parse(const std::vector<std::string>& args);
    static std::optional<CommandLineArgs> parse(int argc, const char* const argv[]);

    static std::string usage(const std::string& program = "looptrace");

    /// Options from the --config file (if any) with command line values on top.
    /// @throws ConfigurationError for a non-integer limit, unknown format or level
    /// @throws IOError if the config file cannot be read
    static SearchOptions resolveOptions(const CommandLineArgs& args);
};

}  // namespace looptrace
