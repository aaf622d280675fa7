#pragma once

#include "looptrace/common/ILoggerBackend.h"
#include "looptrace/io/CycleWriter.h"
#include "looptrace/search/PathLimit.h"

#include <optional>
#include <string>

namespace looptrace {

/// Settings of one cycle search run
struct SearchOptions {
    int limitLength = -1;                   ///< -1 = unlimited
    std::optional<std::string> limitType;   ///< count only vertices of this type
    CycleFormat format = CycleFormat::Ids;
    LogLevel logLevel = LogLevel::Info;

    PathLimit pathLimit() const { return PathLimit(limitLength, limitType); }
};

/// JSON (de)serialization of SearchOptions
///
/// Example:
/// @code
/// {
///   "limitLength": 8,
///   "limitType": "person",
///   "format": "names",
///   "logLevel": "debug"
/// }
/// @endcode
/// Missing keys keep their defaults.
class SearchOptionsSerializer {
public:
    static std::string toJson(const SearchOptions& options);

    /// @throws ConfigurationError on malformed JSON or invalid values
    static SearchOptions fromJson(const std::string& jsonStr);

    /// @throws IOError if the file cannot be read
    /// @throws ConfigurationError on malformed content
    static SearchOptions loadFromFile(const std::string& path);
};

}  // namespace looptrace
