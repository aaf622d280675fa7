// looptrace - list the elementary cycles of a directed edge list
//
// Usage: looptrace <edges.csv> <cycles.txt> [<limit_length> [<limit_type>]]
//                  [--format ids|names|jsonl] [--config options.json] [--log-level level]

#include <looptrace/app/SearchSession.h>
#include <looptrace/cli/CommandLine.h>
#include <looptrace/common/Logger.h>
#include <looptrace/core/Errors.h>

#include <iostream>

using namespace looptrace;

int main(int argc, char* argv[]) {
    std::optional<CommandLineArgs> args;
    try {
        args = CommandLine::parse(argc, argv);
    } catch (const ConfigurationError& ex) {
        std::cerr << ex.what() << '\n';
        std::cout << CommandLine::usage(argv[0]);
        return CommandLine::USAGE_EXIT_CODE;
    }
    if (!args) {
        std::cout << CommandLine::usage(argv[0]);
        return CommandLine::USAGE_EXIT_CODE;
    }

    try {
        Logger::setBackend(Logger::createDefaultBackend(args->logFile()));
    } catch (const IOError& ex) {
        std::cerr << ex.what() << '\n';
        return 3;
    }

    LOG_INFO("Processing started");
    LOG_INFO("csv_input_edges: {}", args->edgesPath);
    LOG_INFO("txt_output_cycles: {}", args->cyclesPath);
    LOG_INFO("cycle_limit_len: {}", args->limitLength.value_or("-1"));
    LOG_INFO("cycle_limit_node_type: {}", args->limitType.value_or("None"));

    try {
        SearchOptions options = CommandLine::resolveOptions(*args);
        Logger::setLevel(options.logLevel);

        SearchSession session(args->edgesPath, args->cyclesPath, options);
        session.run();
    } catch (const ConfigurationError& ex) {
        LOG_ERROR("configuration error: {}", ex.what());
        Logger::flush();
        return 1;
    } catch (const RuntimeSearchError& ex) {
        LOG_ERROR("search aborted: {}", ex.what());
        Logger::flush();
        return 2;
    } catch (const IOError& ex) {
        LOG_ERROR("I/O error: {}", ex.what());
        Logger::flush();
        return 3;
    }

    return 0;
}
