/**
 * SessionContext.hpp - Per-conversation counters shared by the components
 *
 * Passed explicitly to each component; readers only ever see snapshots.
 */

#pragma once

#include <string>

namespace hpv::core {

struct SessionStats {
    int wake_detections = 0;
    int fallback_detections = 0;
    int user_turns = 0;
    int interrupts = 0;
    int recognition_errors = 0;
    int suppressed_echoes = 0;
    bool keyword_active = false;
    std::string engine = "none";
};

class SessionContext {
public:
    SessionStats snapshot() const { return stats_; }

    void recordWake(bool fallback) {
        ++stats_.wake_detections;
        if (fallback) ++stats_.fallback_detections;
    }
    void recordUserTurn() { ++stats_.user_turns; }
    void recordInterrupt() { ++stats_.interrupts; }
    void recordRecognitionError() { ++stats_.recognition_errors; }
    void recordSuppressedEcho() { ++stats_.suppressed_echoes; }
    void setKeywordActive(bool active) { stats_.keyword_active = active; }
    void setEngine(const std::string& engine) { stats_.engine = engine; }
    void reset() { stats_ = SessionStats{}; }

private:
    SessionStats stats_;
};

} // namespace hpv::core
