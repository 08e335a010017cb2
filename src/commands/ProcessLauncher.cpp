/**
 * ProcessLauncher.cpp - posix_spawnp launcher
 */

#include "aegis/commands/ProcessLauncher.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>
#include <sstream>

#include <spawn.h>
#include <sys/wait.h>

extern char** environ;

namespace aegis::commands {

std::vector<std::string> splitCommandLine(const std::string& command_line) {
    std::vector<std::string> argv;
    std::istringstream stream(command_line);
    std::string token;
    while (stream >> token) {
        argv.push_back(token);
    }
    return argv;
}

std::optional<pid_t> PosixLauncher::launch(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        return std::nullopt;
    }

    std::vector<char*> args;
    for (const auto& a : argv) {
        args.push_back(const_cast<char*>(a.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = 0;
    int rc = posix_spawnp(&pid, args[0], nullptr, nullptr, args.data(), environ);
    if (rc != 0) {
        std::cerr << "[Launcher] posix_spawnp(" << argv[0] << ") failed: "
                  << std::strerror(rc) << std::endl;
        return std::nullopt;
    }

    std::cout << "[Launcher] Started " << argv[0] << " (pid " << pid << ")" << std::endl;
    return pid;
}

bool PosixLauncher::terminate(pid_t pid) {
    if (!isRunning(pid)) {
        return false;
    }
    if (::kill(pid, SIGTERM) != 0) {
        std::cerr << "[Launcher] kill(" << pid << ") failed: " << std::strerror(errno) << std::endl;
        return false;
    }
    // Reap if it exited already; otherwise a later isRunning() will
    int status = 0;
    ::waitpid(pid, &status, WNOHANG);
    return true;
}

bool PosixLauncher::isRunning(pid_t pid) {
    int status = 0;
    pid_t r = ::waitpid(pid, &status, WNOHANG);
    if (r == 0) {
        return true;    // still running
    }
    return false;       // exited (now reaped) or not our child
}

} // namespace aegis::commands
