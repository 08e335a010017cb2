/**
 * CommandEngine.hpp - Rule-based command interpretation and execution
 *
 * Keyword rules, checked in order: security mode, normal mode, close app,
 * open app, recall notes, take note, smalltalk, time, unknown.
 */

#pragma once

#include "aegis/commands/CommandDispatcher.hpp"
#include "aegis/commands/NoteStore.hpp"
#include "aegis/commands/ProcessLauncher.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace aegis::commands {

struct CommandConfig {
    std::string owner_name = "Owner";
    std::string wake_phrase = "vortex";
    std::map<std::string, std::string> apps;      // app name -> command line
    std::map<std::string, std::string> aliases;   // spoken keyword -> app name
};

class CommandEngine : public CommandDispatcher {
public:
    CommandEngine(const CommandConfig& config, ProcessLauncher& launcher, NoteStore& notes);

    DispatchResult dispatch(const std::string& text) override;

    // Known app named in the lowered text, via aliases first, then app names.
    std::optional<std::string> findApp(const std::string& lowered) const;

private:
    DispatchResult openApp(const std::string& app);
    DispatchResult closeApp(const std::string& app);
    DispatchResult takeNote(const std::string& text, const std::string& lowered);
    DispatchResult recallNotes();

    CommandConfig config_;
    ProcessLauncher& launcher_;
    NoteStore& notes_;

    std::mutex mutex_;
    std::map<std::string, pid_t> running_;
};

} // namespace aegis::commands
