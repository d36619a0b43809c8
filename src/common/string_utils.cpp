#include "string_utils.h"
#include "structured_logger.h"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace marionette {
namespace utils {

bool StringUtils::isWhitespace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string StringUtils::trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\n\r\f\v");
    if (first == std::string::npos) {
        return ""; // String contains only whitespace
    }
    size_t last = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(first, (last - first + 1));
}

std::vector<std::string> StringUtils::split(const std::string& str, const std::string& delimiter) {
    std::vector<std::string> result;

    if (delimiter.empty()) {
        SLOG_ERROR().message("Empty delimiter in split");
        if (!str.empty()) {
            result.push_back(str);
        }
        return result;
    }

    if (str.empty()) {
        return result;
    }

    size_t start = 0;
    size_t end = 0;
    while ((end = str.find(delimiter, start)) != std::string::npos) {
        result.push_back(str.substr(start, end - start));
        start = end + delimiter.length();
    }
    // Add the last part (or the only part if no delimiter found)
    result.push_back(str.substr(start));
    return result;
}

bool StringUtils::endsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string StringUtils::toLowerCase(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
        return c < 0x80 ? static_cast<char>(std::tolower(c)) : static_cast<char>(c);
    });
    return result;
}

std::string StringUtils::join(const std::vector<std::string>& strings, const std::string& delimiter) {
    std::ostringstream oss;
    for (size_t i = 0; i < strings.size(); ++i) {
        if (i > 0) {
            oss << delimiter;
        }
        oss << strings[i];
    }
    return oss.str();
}

std::string StringUtils::collapseWhitespace(const std::string& str) {
    std::string result;
    result.reserve(str.size());
    bool pendingSpace = false;
    for (char c : str) {
        if (isWhitespace(c)) {
            pendingSpace = !result.empty();
            continue;
        }
        if (pendingSpace) {
            result.push_back(' ');
            pendingSpace = false;
        }
        result.push_back(c);
    }
    return result;
}

bool StringUtils::containsNormalized(const std::string& haystack, const std::string& needle) {
    std::string normalizedNeedle = toLowerCase(collapseWhitespace(needle));
    if (normalizedNeedle.empty()) {
        return true;
    }
    return toLowerCase(collapseWhitespace(haystack)).find(normalizedNeedle) != std::string::npos;
}

} // namespace utils
} // namespace marionette
