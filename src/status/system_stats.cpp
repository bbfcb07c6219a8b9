#include "status/system_stats.h"

#include <cerrno>
#include <cstdlib>

#include "common/utils.h"

std::optional<long long> SystemStats::ParseInteger(const std::string &text) {
    const char *begin = text.c_str();
    char *end = nullptr;
    errno = 0;
    long long value = strtoll(begin, &end, 10);
    if (end == begin || errno == ERANGE) {
        return std::nullopt;
    }
    while (*end == ' ' || *end == '\t' || *end == '\r' || *end == '\n') {
        end++;
    }
    if (*end != '\0') {
        return std::nullopt;
    }
    return value;
}

std::optional<double> SystemStats::ReadCpuTempC(const std::string &path) {
    auto line = Utils::ReadFirstLine(path);
    if (!line) {
        return std::nullopt;
    }
    auto milli = ParseInteger(*line);
    if (!milli) {
        return std::nullopt;
    }
    return *milli / 1000.0;
}

std::optional<double> SystemStats::ReadFreeGb(const std::string &path) {
    auto free_bytes = Utils::GetFreeSpaceBytes(path);
    if (!free_bytes) {
        return std::nullopt;
    }
    return *free_bytes / (1024.0 * 1024.0 * 1024.0);
}

std::optional<double> SystemStats::ReadBatteryV(const std::string &path, double scale) {
    if (path.empty()) {
        return std::nullopt;
    }
    auto line = Utils::ReadFirstLine(path);
    if (!line) {
        return std::nullopt;
    }
    auto raw = ParseInteger(*line);
    if (!raw) {
        return std::nullopt;
    }
    return *raw * scale;
}
