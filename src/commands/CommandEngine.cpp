/**
 * CommandEngine.cpp - Keyword rules
 */

#include "aegis/commands/CommandEngine.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <initializer_list>
#include <iostream>
#include <utility>

namespace aegis::commands {

namespace {

std::string toLower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
    return s.substr(start, end - start);
}

bool containsAny(const std::string& text, std::initializer_list<const char*> keywords) {
    for (const char* kw : keywords) {
        if (text.find(kw) != std::string::npos) return true;
    }
    return false;
}

DispatchResult reply(Intent intent, std::string message, bool executed = true) {
    DispatchResult result;
    result.intent = intent;
    result.spoken_message = std::move(message);
    result.intent_executed = executed;
    return result;
}

} // anonymous namespace

const char* toString(Intent intent) {
    switch (intent) {
        case Intent::OpenApp:      return "OpenApp";
        case Intent::CloseApp:     return "CloseApp";
        case Intent::Note:         return "Note";
        case Intent::Recall:       return "Recall";
        case Intent::Smalltalk:    return "Smalltalk";
        case Intent::Time:         return "Time";
        case Intent::SecurityMode: return "SecurityMode";
        case Intent::NormalMode:   return "NormalMode";
        case Intent::Unknown:      return "Unknown";
    }
    return "Unknown";
}

const char* toString(SecurityDirective directive) {
    switch (directive) {
        case SecurityDirective::None:      return "None";
        case SecurityDirective::Elevate:   return "Elevate";
        case SecurityDirective::Normalize: return "Normalize";
    }
    return "Unknown";
}

CommandEngine::CommandEngine(const CommandConfig& config, ProcessLauncher& launcher, NoteStore& notes)
    : config_(config)
    , launcher_(launcher)
    , notes_(notes) {
    config_.wake_phrase = toLower(config_.wake_phrase);
}

DispatchResult CommandEngine::dispatch(const std::string& text) {
    const std::string trimmed = trim(text);
    const std::string lowered = toLower(trimmed);

    if (lowered.empty()) {
        return reply(Intent::Unknown, "I didn't catch that. Please repeat.", false);
    }

    if (containsAny(lowered, {"enter security mode", "security alert"})) {
        auto result = reply(Intent::SecurityMode,
                            "Entering security mode. All systems on high alert.");
        result.security = SecurityDirective::Elevate;
        return result;
    }

    if (containsAny(lowered, {"normal mode", "stand down"})) {
        auto result = reply(Intent::NormalMode, "Returning to normal operational mode.");
        result.security = SecurityDirective::Normalize;
        return result;
    }

    if (containsAny(lowered, {"close", "exit", "shut", "quit"})) {
        if (auto app = findApp(lowered)) {
            return closeApp(*app);
        }
    }

    if (containsAny(lowered, {"open", "launch", "start"})) {
        if (auto app = findApp(lowered)) {
            return openApp(*app);
        }
    }

    if (containsAny(lowered, {"what do you remember", "my notes"})) {
        return recallNotes();
    }

    if (containsAny(lowered, {"note", "remember"}) && lowered.find("note pad") == std::string::npos) {
        return takeNote(trimmed, lowered);
    }

    if (!config_.wake_phrase.empty() && lowered.find(config_.wake_phrase) != std::string::npos) {
        return reply(Intent::Smalltalk, "You called, " + config_.owner_name + ". I'm listening.");
    }

    if (containsAny(lowered, {"how are you", "how are u", "are you there"})) {
        return reply(Intent::Smalltalk, "Online and fully operational. How can I assist you?");
    }

    if (containsAny(lowered, {"time is it", "current time"})) {
        std::time_t now = std::time(nullptr);
        std::tm tm{};
        localtime_r(&now, &tm);
        char buf[8];
        std::strftime(buf, sizeof(buf), "%H:%M", &tm);
        return reply(Intent::Time, std::string("It is ") + buf + ".");
    }

    return reply(Intent::Unknown, "I'm still learning. I didn't understand that command yet.", false);
}

std::optional<std::string> CommandEngine::findApp(const std::string& lowered) const {
    // Longest alias first so "vs code" wins over "code"
    const std::pair<const std::string, std::string>* best = nullptr;
    for (const auto& entry : config_.aliases) {
        if (lowered.find(entry.first) != std::string::npos &&
            (!best || entry.first.size() > best->first.size())) {
            best = &entry;
        }
    }
    if (best) {
        return best->second;
    }

    for (const auto& entry : config_.apps) {
        if (lowered.find(entry.first) != std::string::npos) {
            return entry.first;
        }
    }
    return std::nullopt;
}

DispatchResult CommandEngine::openApp(const std::string& app) {
    auto it = config_.apps.find(app);
    if (it == config_.apps.end()) {
        return reply(Intent::OpenApp, "I don't know how to open that application yet.", false);
    }

    auto pid = launcher_.launch(splitCommandLine(it->second));
    if (!pid) {
        auto result = reply(Intent::OpenApp, "I couldn't open " + app + ".", false);
        result.error = ErrorKind::CollaboratorError;
        return result;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_[app] = *pid;
    }
    return reply(Intent::OpenApp, "Opening " + app + " for you.");
}

DispatchResult CommandEngine::closeApp(const std::string& app) {
    pid_t pid = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = running_.find(app);
        if (it != running_.end()) {
            pid = it->second;
            running_.erase(it);
        }
    }

    if (pid == 0 || !launcher_.terminate(pid)) {
        return reply(Intent::CloseApp, app + " isn't running.", false);
    }
    return reply(Intent::CloseApp, "Closing " + app + " for you.");
}

DispatchResult CommandEngine::takeNote(const std::string& text, const std::string& lowered) {
    std::string note = text;
    for (const char* kw : {"note that", "note this", "note", "remember that", "remember"}) {
        size_t idx = lowered.find(kw);
        if (idx != std::string::npos) {
            note = trim(text.substr(idx + std::char_traits<char>::length(kw)));
            break;
        }
    }

    if (note.empty()) {
        return reply(Intent::Note, "What should I remember?", false);
    }

    if (!notes_.add(note)) {
        auto result = reply(Intent::Note, "I couldn't save that note.", false);
        result.error = ErrorKind::CollaboratorError;
        return result;
    }
    return reply(Intent::Note, "I'll remember that: " + note);
}

DispatchResult CommandEngine::recallNotes() {
    auto recent = notes_.recent(3);
    if (recent.empty()) {
        return reply(Intent::Recall, "You haven't asked me to remember anything yet.");
    }

    std::string message = "You asked me to remember: ";
    for (size_t i = 0; i < recent.size(); ++i) {
        if (i > 0) message += "; ";
        message += recent[i].text;
    }
    message += ".";
    return reply(Intent::Recall, message);
}

} // namespace aegis::commands
