#include "recorder/timestamp_log.h"

#include <cstdio>

#include "common/logging.h"

TimestampLog::TimestampLog() {}

TimestampLog::~TimestampLog() { Close(); }

bool TimestampLog::Open(const std::string &path) {
    file_.open(path, std::ios::out | std::ios::trunc);
    if (!file_.is_open()) {
        ERROR_PRINT("Could not open %s", path.c_str());
        return false;
    }
    file_ << "frame_idx,unix_time\n";
    return file_.good();
}

bool TimestampLog::Append(uint64_t frame_idx, double unix_time) {
    if (!file_.is_open()) {
        return false;
    }
    char line[64];
    snprintf(line, sizeof(line), "%llu,%.6f\n", static_cast<unsigned long long>(frame_idx),
             unix_time);
    // one row per encoded frame is on disk even if the process dies
    file_ << line << std::flush;
    return file_.good();
}

void TimestampLog::Close() {
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
}

bool TimestampLog::is_open() const { return file_.is_open(); }
