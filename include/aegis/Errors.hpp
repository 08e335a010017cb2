/**
 * Errors.hpp - Failure taxonomy shared by the pipeline stages
 */

#pragma once

#include <stdexcept>
#include <string>

namespace aegis {

enum class ErrorKind {
    None,
    ResourceBusy,        // lease conflict, cycle aborted
    DeviceUnavailable,   // mic/camera/speaker could not be opened
    VerificationFailed,  // expected outcome, drives Lockdown
    TranscriptionEmpty,  // nothing understood, apology instead of alarm
    CollaboratorError    // STT/dispatch/embedding/TTS threw
};

const char* toString(ErrorKind kind);

/**
 * Raised by collaborator backends on runtime failure (transport errors,
 * malformed replies, model failures). Caught at the Orchestrator boundary.
 */
class CollaboratorError : public std::runtime_error {
public:
    explicit CollaboratorError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace aegis
