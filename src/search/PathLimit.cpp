#include "looptrace/search/PathLimit.h"
#include "looptrace/core/Errors.h"

#include <cctype>
#include <charconv>

namespace looptrace {

PathLimit PathLimit::parse(const std::string& lengthText, std::optional<std::string> type) {
    size_t begin = 0;
    size_t end = lengthText.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(lengthText[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(lengthText[end - 1]))) --end;

    // from_chars rejects a leading '+', which int() accepts
    if (begin + 1 < end && lengthText[begin] == '+' && lengthText[begin + 1] != '-') ++begin;

    int value = 0;
    const char* first = lengthText.data() + begin;
    const char* last = lengthText.data() + end;
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (begin == end || ec != std::errc() || ptr != last) {
        throw ConfigurationError("Cycle length limit '" + lengthText + "' is not an integer");
    }

    return PathLimit(value, std::move(type));
}

std::string PathLimit::toString() const {
    if (length < 0) return "unlimited";
    if (type) return std::to_string(length) + " vertices of type '" + *type + "'";
    return std::to_string(length) + " vertices";
}

}  // namespace looptrace
