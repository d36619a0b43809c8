#ifndef MARIONETTE_OS_UTILS_H
#define MARIONETTE_OS_UTILS_H

#include <string>
#include <vector>
#include <cstdint>

namespace marionette {
namespace os {

/**
 * @brief Path helpers for template, screenshot and executable lookup
 */
class PathUtils {
public:
    static std::string join(const std::string& part1, const std::string& part2);
    static std::string getFileName(const std::string& path);
    static std::string getExtension(const std::string& path);

    static bool isAbsolute(const std::string& path);
    static bool isFile(const std::string& path);
    static bool isExecutable(const std::string& path);

    // "~" and "~/..." resolve against the user's home directory
    static std::string expandUserHome(const std::string& path);

    /**
     * @brief Locate a bare command name on the PATH search list.
     *
     * On Windows the PATHEXT extensions are tried when the name has none.
     * @return absolute path of the first executable hit, or empty
     */
    static std::string findOnSearchPath(const std::string& command);

    static char getPathListSeparator();
};

/**
 * @brief Process environment queries
 */
class SystemInfo {
public:
    static std::string getEnvironmentVariable(const std::string& name);
    static std::string getUserHomeDirectory();
    // Falls back to /tmp, or C:\Temp on Windows, when the OS reports none
    static std::string getTempDirectory();
    static uint32_t getCurrentProcessId();
};

} // namespace os
} // namespace marionette

#endif // MARIONETTE_OS_UTILS_H
