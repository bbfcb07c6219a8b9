#ifndef UTILS_
#define UTILS_

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "common/frame_buffer.h"

namespace fs = std::filesystem;

struct FreeDeleter {
    void operator()(uint8_t *ptr) const {
        if (ptr) {
            free(ptr);
        }
    }
};

struct Buffer {
    std::unique_ptr<uint8_t, FreeDeleter> start;
    unsigned long length = 0;
};

struct FileInfo {
    std::string date;
    std::string hour;
    std::string filename;
};

class Utils {
  public:
    static FileInfo GenerateFilename();
    static std::string PrefixZero(int src, int digits);
    static std::string GenerateUuid();
    static double UnixTimeNow();
    static int64_t MonotonicTimeUs();

    static bool CreateFolder(const std::string &folder_path);
    static bool CheckDriveSpace(const std::string &file_path, unsigned long min_free_mb);
    static std::optional<uint64_t> GetFreeSpaceBytes(const std::string &file_path);
    static std::optional<std::string> ReadFirstLine(const std::string &file_path);

    static Buffer ConvertYuvToJpeg(const FrameBuffer &frame, int quality = 80);
    static bool WriteJpegImage(const Buffer &buffer, const std::string &url);
    static bool CreateJpegImage(const FrameBuffer &frame, const std::string &url,
                                int quality = 80);
};

#endif // UTILS_
