#ifndef MARIONETTE_STRING_UTILS_H
#define MARIONETTE_STRING_UTILS_H

#include <string>
#include <vector>

namespace marionette {
namespace utils {

/**
 * @brief String helpers shared by the OCR engine, key parsing and process matching
 */
class StringUtils {
public:
    /**
     * @brief Remove leading and trailing whitespace from string
     * @param str String to trim (input parameter)
     * @return Trimmed string
     */
    static std::string trim(const std::string& str);

    /**
     * @brief Split string by delimiter into vector of strings
     * @param str String to split (input parameter)
     * @param delimiter Delimiter character or string (must not be empty)
     * @return Vector of split strings (empty if input is empty)
     * @note Consecutive delimiters produce empty elements
     */
    static std::vector<std::string> split(const std::string& str, const std::string& delimiter);

    static bool endsWith(const std::string& str, const std::string& suffix);

    // ASCII lowercase; bytes of multi-byte UTF-8 sequences pass through unchanged
    static std::string toLowerCase(const std::string& str);

    static std::string join(const std::vector<std::string>& strings, const std::string& delimiter);

    /**
     * @brief Replace every run of whitespace with a single space and trim the ends
     */
    static std::string collapseWhitespace(const std::string& str);

    /**
     * @brief Case-insensitive containment after collapsing whitespace on both sides
     * @note An empty (or all-whitespace) needle is contained in everything
     */
    static bool containsNormalized(const std::string& haystack, const std::string& needle);

private:
    static bool isWhitespace(char c);
};

} // namespace utils
} // namespace marionette

#endif // MARIONETTE_STRING_UTILS_H
