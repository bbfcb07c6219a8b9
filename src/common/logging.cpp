#include "common/logging.h"

#include <chrono>
#include <ctime>

std::string GetFileName(const std::string &file_path) {
    size_t start_pos = file_path.find_last_of("/\\") + 1;
    size_t end_pos = file_path.find_last_of(".");
    if (start_pos == std::string::npos) {
        start_pos = 0;
    }
    if (end_pos == std::string::npos || end_pos < start_pos) {
        end_pos = file_path.length();
    }
    return file_path.substr(start_pos, end_pos - start_pos);
}

std::string GetLogTime() {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    time_t t = std::chrono::system_clock::to_time_t(now);
    tm ltm = {};
    localtime_r(&t, &ltm);

    char buf[32];
    snprintf(buf, sizeof(buf), "%02d:%02d:%02d.%03d", ltm.tm_hour, ltm.tm_min, ltm.tm_sec,
             static_cast<int>(ms.count()));
    return buf;
}
