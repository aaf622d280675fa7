#include "looptrace/cli/CommandLine.h"
#include "looptrace/core/Errors.h"

namespace looptrace {

std::optional<CommandLineArgs> CommandLine::parse(int argc, const char* const argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse(args);
}

std::optional<CommandLineArgs> CommandLine::parse(const std::vector<std::string>& args) {
    CommandLineArgs result;
    std::vector<std::string> positionals;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        std::optional<std::string>* target = nullptr;
        if (arg == "--format") target = &result.format;
        else if (arg == "--config") target = &result.configPath;
        else if (arg == "--log-level") target = &result.logLevel;

        if (target) {
            if (i + 1 >= args.size()) {
                throw ConfigurationError("Option " + arg + " needs a value");
            }
            *target = args[++i];
            continue;
        }

        // "-1" is a valid positional length limit
        if (arg.size() > 2 && arg.rfind("--", 0) == 0) {
            throw ConfigurationError("Unknown option " + arg);
        }
        positionals.push_back(arg);
    }

    if (positionals.size() < 2) {
        return std::nullopt;
    }
    if (positionals.size() > 4) {
        throw ConfigurationError("Too many arguments");
    }

    result.edgesPath = positionals[0];
    result.cyclesPath = positionals[1];
    if (positionals.size() >= 3) result.limitLength = positionals[2];
    if (positionals.size() >= 4) result.limitType = positionals[3];
    return result;
}

std::string CommandLine::usage(const std::string& program) {
    return "\n"
           "    Usage: " + program + " <csv_edges_input> <txt_cycles_output> "
           "[<cycle_limit_length> [<cycle_limit_node_type>]]\n"
           "           [--format ids|names|jsonl] [--config <options.json>] [--log-level <level>]\n"
           "    Example: " + program + " ./edges.csv ./cycles.txt 8\n";
}

SearchOptions CommandLine::resolveOptions(const CommandLineArgs& args) {
    SearchOptions options;
    if (args.configPath) {
        options = SearchOptionsSerializer::loadFromFile(*args.configPath);
    }

    if (args.limitLength) {
        options.limitLength = PathLimit::parse(*args.limitLength).length;
    }
    if (args.limitType) {
        options.limitType = *args.limitType;
    }
    if (args.format) {
        auto format = parseCycleFormat(*args.format);
        if (!format) {
            throw ConfigurationError("Unknown cycle format '" + *args.format + "'");
        }
        options.format = *format;
    }
    if (args.logLevel) {
        auto level = parseLogLevel(*args.logLevel);
        if (!level) {
            throw ConfigurationError("Unknown log level '" + *args.logLevel + "'");
        }
        options.logLevel = *level;
    }
    return options;
}

}  // namespace looptrace
