#include "process_matcher.h"
#include "../common/os_utils.h"
#include "../common/string_utils.h"
#include <stdexcept>

namespace marionette {
namespace registry {

namespace {
    std::string normalizeName(const std::string& name) {
        std::string lowered = utils::StringUtils::toLowerCase(utils::StringUtils::trim(name));
        if (utils::StringUtils::endsWith(lowered, ".exe")) {
            lowered.resize(lowered.size() - 4);
        }
        return lowered;
    }
}

ProcessMatcher::ProcessMatcher(std::string name, ocal::ProcessId pid, bool preferNewest)
    : m_name(std::move(name)), m_pid(pid), m_preferNewest(preferNewest) {}

ProcessMatcher ProcessMatcher::byName(const std::string& executableName) {
    if (normalizeName(executableName).empty()) {
        throw std::invalid_argument("Process name must not be empty");
    }
    return ProcessMatcher(normalizeName(executableName), 0, false);
}

ProcessMatcher ProcessMatcher::byPid(ocal::ProcessId pid) {
    if (pid == 0) {
        throw std::invalid_argument("Process ID must not be 0");
    }
    return ProcessMatcher("", pid, false);
}

ProcessMatcher ProcessMatcher::newest(const std::string& executableName) {
    ProcessMatcher matcher = byName(executableName);
    matcher.m_preferNewest = true;
    return matcher;
}

bool ProcessMatcher::matches(const ocal::ProcessInfo& process) const {
    if (m_pid != 0) {
        return process.processId == m_pid;
    }
    if (normalizeName(process.name) == m_name) {
        return true;
    }
    // /proc/<pid>/stat truncates names to 15 characters; the path does not
    return !process.executablePath.empty() &&
           normalizeName(os::PathUtils::getFileName(process.executablePath)) == m_name;
}

std::vector<ocal::ProcessInfo> ProcessMatcher::select(const std::vector<ocal::ProcessInfo>& processes,
                                                      const std::set<ocal::ProcessId>& excluded) const {
    std::vector<ocal::ProcessInfo> candidates;
    for (const auto& process : processes) {
        if (!matches(process)) {
            continue;
        }
        if (m_pid == 0 && excluded.count(process.processId) > 0) {
            continue;
        }
        candidates.push_back(process);
    }
    return candidates;
}

std::string ProcessMatcher::describe() const {
    if (m_pid != 0) {
        return "pid " + std::to_string(m_pid);
    }
    return (m_preferNewest ? "newest process named '" : "process named '") + m_name + "'";
}

} // namespace registry
} // namespace marionette
