/**
 * Error.hpp - Error taxonomy shared by all voice components
 */

#pragma once

#include <string>

namespace hpv::core {

enum class ErrorKind {
    Acquisition,     // Microphone unavailable or denied; fatal to a session
    ModelLoad,       // Keyword model missing; triggers transcription fallback
    Recognition,     // Network blip, no-speech, capture glitch; recoverable
    Playback,        // Synthesis or output failure; recoverable
    StateViolation   // Programming invariant broken; prevented by guards
};

struct Error {
    ErrorKind kind = ErrorKind::Recognition;
    std::string subsystem;
    std::string message;

    bool isFatal() const { return kind == ErrorKind::Acquisition; }
    std::string describe() const;
};

const char* toString(ErrorKind kind);

} // namespace hpv::core
