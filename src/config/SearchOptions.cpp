#include "looptrace/config/SearchOptions.h"
#include "looptrace/core/Errors.h"

#include <nlohmann/json.hpp>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>

using json = nlohmann::json;

namespace looptrace {

std::string SearchOptionsSerializer::toJson(const SearchOptions& options) {
    json j;
    j["limitLength"] = options.limitLength;
    if (options.limitType) {
        j["limitType"] = *options.limitType;
    } else {
        j["limitType"] = nullptr;
    }
    j["format"] = cycleFormatName(options.format);
    j["logLevel"] = logLevelName(options.logLevel);
    return j.dump(2);
}

SearchOptions SearchOptionsSerializer::fromJson(const std::string& jsonStr) {
    SearchOptions options;

    json j;
    try {
        j = json::parse(jsonStr);
    } catch (const json::exception& ex) {
        throw ConfigurationError(std::string("Invalid options JSON: ") + ex.what());
    }
    if (!j.is_object()) {
        throw ConfigurationError("Options JSON must be an object");
    }

    if (j.contains("limitLength")) {
        if (!j["limitLength"].is_number_integer()) {
            throw ConfigurationError("Option 'limitLength' must be an integer");
        }
        const json& length = j["limitLength"];
        bool fits = length.is_number_unsigned()
            ? length.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
            : length.get<std::int64_t>() >= std::numeric_limits<int>::min() &&
              length.get<std::int64_t>() <= std::numeric_limits<int>::max();
        if (!fits) {
            throw ConfigurationError("Option 'limitLength' is out of range");
        }
        options.limitLength = length.get<int>();
    }

    if (j.contains("limitType") && !j["limitType"].is_null()) {
        if (!j["limitType"].is_string()) {
            throw ConfigurationError("Option 'limitType' must be a string");
        }
        options.limitType = j["limitType"].get<std::string>();
    }

    if (j.contains("format")) {
        auto format = j["format"].is_string()
            ? parseCycleFormat(j["format"].get<std::string>())
            : std::nullopt;
        if (!format) {
            throw ConfigurationError("Option 'format' must be one of ids, names, jsonl");
        }
        options.format = *format;
    }

    if (j.contains("logLevel")) {
        auto level = j["logLevel"].is_string()
            ? parseLogLevel(j["logLevel"].get<std::string>())
            : std::nullopt;
        if (!level) {
            throw ConfigurationError("Option 'logLevel' is not a known log level");
        }
        options.logLevel = *level;
    }

    return options;
}

SearchOptions SearchOptionsSerializer::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw IOError("Cannot open options file '" + path + "'");
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return fromJson(buffer.str());
}

}  // namespace looptrace
