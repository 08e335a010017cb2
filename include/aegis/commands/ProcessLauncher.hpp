/**
 * ProcessLauncher.hpp - Starting and stopping desktop applications
 */

#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace aegis::commands {

class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;

    // Returns the child pid, nullopt on failure.
    virtual std::optional<pid_t> launch(const std::vector<std::string>& argv) = 0;

    // false if the process is not running
    virtual bool terminate(pid_t pid) = 0;

    virtual bool isRunning(pid_t pid) = 0;
};

/**
 * posix_spawnp without a shell. Children are reaped on terminate() and when
 * polled with isRunning().
 */
class PosixLauncher : public ProcessLauncher {
public:
    std::optional<pid_t> launch(const std::vector<std::string>& argv) override;
    bool terminate(pid_t pid) override;
    bool isRunning(pid_t pid) override;
};

// Whitespace split, no quoting rules.
std::vector<std::string> splitCommandLine(const std::string& command_line);

} // namespace aegis::commands
