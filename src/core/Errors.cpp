/**
 * Errors.cpp - Names for error kinds and event kinds (used in log lines)
 */

#include "aegis/Errors.hpp"
#include "aegis/Events.hpp"

namespace aegis {

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:               return "None";
        case ErrorKind::ResourceBusy:       return "ResourceBusy";
        case ErrorKind::DeviceUnavailable:  return "DeviceUnavailable";
        case ErrorKind::VerificationFailed: return "VerificationFailed";
        case ErrorKind::TranscriptionEmpty: return "TranscriptionEmpty";
        case ErrorKind::CollaboratorError:  return "CollaboratorError";
    }
    return "Unknown";
}

const char* toString(EventKind kind) {
    switch (kind) {
        case EventKind::WakeDetected:   return "WakeDetected";
        case EventKind::CameraBlocked:  return "CameraBlocked";
        case EventKind::CameraRestored: return "CameraRestored";
        case EventKind::Shutdown:       return "Shutdown";
    }
    return "Unknown";
}

} // namespace aegis
