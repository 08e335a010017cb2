/**
 * CommandDispatcher.hpp - Closed result type for command dispatch
 */

#pragma once

#include "aegis/Errors.hpp"

#include <string>

namespace aegis::commands {

enum class Intent {
    OpenApp,
    CloseApp,
    Note,
    Recall,
    Smalltalk,
    Time,
    SecurityMode,
    NormalMode,
    Unknown
};

// Requested change to the SecurityState, applied by the Orchestrator.
enum class SecurityDirective { None, Elevate, Normalize };

const char* toString(Intent intent);
const char* toString(SecurityDirective directive);

struct DispatchResult {
    std::string spoken_message;
    bool intent_executed = false;
    ErrorKind error = ErrorKind::None;
    SecurityDirective security = SecurityDirective::None;
    Intent intent = Intent::Unknown;
};

class CommandDispatcher {
public:
    virtual ~CommandDispatcher() = default;

    virtual DispatchResult dispatch(const std::string& text) = 0;
};

} // namespace aegis::commands
