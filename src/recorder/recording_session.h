#ifndef RECORDING_SESSION_H_
#define RECORDING_SESSION_H_

#include <cstdint>
#include <optional>
#include <string>

enum class SessionStatus {
    IDLE,
    RECORDING,
    STOPPED,
    FAILED
};

inline const char *ToString(SessionStatus status) {
    switch (status) {
        case SessionStatus::IDLE:
            return "idle";
        case SessionStatus::RECORDING:
            return "recording";
        case SessionStatus::STOPPED:
            return "stopped";
        case SessionStatus::FAILED:
            return "failed";
    }
    return "unknown";
}

struct RecordingSession {
    std::string id;
    double start_time = 0.0;
    std::string output_path;
    SessionStatus status = SessionStatus::IDLE;
    uint64_t frames_written = 0;
    uint64_t frames_dropped = 0;
    std::optional<double> stop_time;
    std::optional<std::string> error;
    std::string encoder;
    int width = 0;
    int height = 0;
    int fps = 0;
};

#endif // RECORDING_SESSION_H_
