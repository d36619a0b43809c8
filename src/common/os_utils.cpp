#include "os_utils.h"
#include <filesystem>
#include <algorithm>
#include <cstdlib>
#include <sstream>

#ifdef _WIN32
    #ifndef WIN32_LEAN_AND_MEAN
        #define WIN32_LEAN_AND_MEAN
    #endif
    #ifndef NOMINMAX
        #define NOMINMAX
    #endif
    #include <windows.h>
#else
    #include <unistd.h>
    #include <pwd.h>
#endif

namespace marionette {
namespace os {

namespace fs = std::filesystem;

std::string PathUtils::join(const std::string& part1, const std::string& part2) {
    if (part1.empty()) return part2;
    if (part2.empty()) return part1;
    return (fs::path(part1) / fs::path(part2)).string();
}

std::string PathUtils::getFileName(const std::string& path) {
    return fs::path(path).filename().string();
}

std::string PathUtils::getExtension(const std::string& path) {
    return fs::path(path).extension().string();
}

bool PathUtils::isAbsolute(const std::string& path) {
    return fs::path(path).is_absolute();
}

bool PathUtils::isFile(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool PathUtils::isExecutable(const std::string& path) {
    if (!isFile(path)) {
        return false;
    }
#ifdef _WIN32
    std::string ext = getExtension(path);
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
    return ext == ".exe" || ext == ".com" || ext == ".bat" || ext == ".cmd";
#else
    return access(path.c_str(), X_OK) == 0;
#endif
}

std::string PathUtils::expandUserHome(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;

    std::string homeDir = SystemInfo::getUserHomeDirectory();
    if (path.length() == 1) return homeDir;
    if (path[1] == '/' || path[1] == '\\') {
        return join(homeDir, path.substr(2));
    }
    return path;
}

std::string PathUtils::findOnSearchPath(const std::string& command) {
    if (command.empty()) {
        return "";
    }

    std::vector<std::string> suffixes{""};
#ifdef _WIN32
    if (getExtension(command).empty()) {
        std::string pathext = SystemInfo::getEnvironmentVariable("PATHEXT");
        if (pathext.empty()) {
            pathext = ".COM;.EXE;.BAT;.CMD";
        }
        std::stringstream ss(pathext);
        std::string ext;
        while (std::getline(ss, ext, ';')) {
            if (!ext.empty()) suffixes.push_back(ext);
        }
    }
#endif

    std::stringstream dirs(SystemInfo::getEnvironmentVariable("PATH"));
    std::string dir;
    while (std::getline(dirs, dir, getPathListSeparator())) {
        if (dir.empty()) {
            continue;
        }
        for (const auto& suffix : suffixes) {
            std::string candidate = join(dir, command + suffix);
            if (isExecutable(candidate)) {
                std::error_code ec;
                fs::path absolute = fs::absolute(candidate, ec);
                return ec ? candidate : absolute.string();
            }
        }
    }
    return "";
}

char PathUtils::getPathListSeparator() {
#ifdef _WIN32
    return ';';
#else
    return ':';
#endif
}

std::string SystemInfo::getEnvironmentVariable(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : "";
}

std::string SystemInfo::getUserHomeDirectory() {
#ifdef _WIN32
    std::string profile = getEnvironmentVariable("USERPROFILE");
    return profile.empty() ? "C:\\" : profile;
#else
    std::string home = getEnvironmentVariable("HOME");
    if (!home.empty()) return home;
    struct passwd* pw = getpwuid(getuid());
    return (pw && pw->pw_dir) ? std::string(pw->pw_dir) : "/";
#endif
}

std::string SystemInfo::getTempDirectory() {
    std::error_code ec;
    fs::path tmp = fs::temp_directory_path(ec);
    if (!ec) {
        return tmp.string();
    }
#ifdef _WIN32
    return "C:\\Temp";
#else
    return "/tmp";
#endif
}

uint32_t SystemInfo::getCurrentProcessId() {
#ifdef _WIN32
    return static_cast<uint32_t>(GetCurrentProcessId());
#else
    return static_cast<uint32_t>(getpid());
#endif
}

} // namespace os
} // namespace marionette
