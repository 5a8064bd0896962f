/**
 * Error.cpp - Error formatting helpers
 */

#include "hpv/core/Error.hpp"

namespace hpv::core {

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Acquisition:    return "AcquisitionError";
        case ErrorKind::ModelLoad:      return "ModelLoadError";
        case ErrorKind::Recognition:    return "RecognitionError";
        case ErrorKind::Playback:       return "PlaybackError";
        case ErrorKind::StateViolation: return "StateViolation";
    }
    return "UnknownError";
}

std::string Error::describe() const {
    std::string text = toString(kind);
    text += " [" + subsystem + "]";
    if (!message.empty()) {
        text += ": " + message;
    }
    return text;
}

} // namespace hpv::core
