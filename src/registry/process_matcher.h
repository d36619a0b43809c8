#ifndef MARIONETTE_PROCESS_MATCHER_H
#define MARIONETTE_PROCESS_MATCHER_H

#include <set>
#include <string>
#include <vector>
#include "../ocal/desktop_backend.h"

namespace marionette {
namespace registry {

/**
 * @brief Selects an already running process for registration
 *
 * Names compare case-insensitively against the executable file name, with
 * or without a trailing ".exe".
 */
class ProcessMatcher {
public:
    static ProcessMatcher byName(const std::string& executableName);
    static ProcessMatcher byPid(ocal::ProcessId pid);
    // Like byName, but several hits resolve to the most recently started one
    static ProcessMatcher newest(const std::string& executableName);

    bool matches(const ocal::ProcessInfo& process) const;

    /**
     * @brief Candidates among processes, skipping the excluded (already bound) ones
     *
     * An explicit PID is never excluded here; the registry reports that case itself.
     */
    std::vector<ocal::ProcessInfo> select(const std::vector<ocal::ProcessInfo>& processes,
                                          const std::set<ocal::ProcessId>& excluded) const;

    bool isPidMatcher() const { return m_pid != 0; }
    bool prefersNewest() const { return m_preferNewest; }
    ocal::ProcessId pid() const { return m_pid; }
    std::string describe() const;

private:
    ProcessMatcher(std::string name, ocal::ProcessId pid, bool preferNewest);

    std::string m_name;
    ocal::ProcessId m_pid;
    bool m_preferNewest;
};

} // namespace registry
} // namespace marionette

#endif // MARIONETTE_PROCESS_MATCHER_H
