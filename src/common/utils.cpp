#include "common/utils.h"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <sstream>
#include <sys/statvfs.h>
#include <vector>

#include <jpeglib.h>
#include <libyuv.h>
#include <uuid/uuid.h>

#include "common/logging.h"

bool Utils::CreateFolder(const std::string &folder_path) {
    if (folder_path.empty()) {
        return false;
    }

    try {
        fs::create_directories(folder_path);
        DEBUG_PRINT("Directory created: %s", folder_path.c_str());
        return true;
    } catch (const fs::filesystem_error &e) {
        ERROR_PRINT("Failed to create directory %s: %s", folder_path.c_str(), e.what());
        return false;
    }
}

bool Utils::CheckDriveSpace(const std::string &file_path, unsigned long min_free_mb) {
    auto free_bytes = GetFreeSpaceBytes(file_path);
    if (!free_bytes) {
        return false;
    }
    return *free_bytes / (1024 * 1024) >= min_free_mb;
}

std::optional<uint64_t> Utils::GetFreeSpaceBytes(const std::string &file_path) {
    struct statvfs stat;
    if (statvfs(file_path.c_str(), &stat) != 0) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(stat.f_frsize) * stat.f_bavail;
}

std::optional<std::string> Utils::ReadFirstLine(const std::string &file_path) {
    std::ifstream file(file_path);
    if (!file) {
        return std::nullopt;
    }
    std::string line;
    if (!std::getline(file, line)) {
        return std::nullopt;
    }
    return line;
}

std::string Utils::PrefixZero(int src, int digits) {
    std::string str = std::to_string(src);
    if (static_cast<int>(str.length()) >= digits) {
        return str;
    }
    std::string n_zero(digits - str.length(), '0');
    return n_zero + str;
}

FileInfo Utils::GenerateFilename() {
    time_t now = time(0);
    tm ltm = {};
    localtime_r(&now, &ltm);

    std::string year = Utils::PrefixZero(1900 + ltm.tm_year, 4);
    std::string month = Utils::PrefixZero(1 + ltm.tm_mon, 2);
    std::string day = Utils::PrefixZero(ltm.tm_mday, 2);
    std::string hour = Utils::PrefixZero(ltm.tm_hour, 2);
    std::string min = Utils::PrefixZero(ltm.tm_min, 2);
    std::string sec = Utils::PrefixZero(ltm.tm_sec, 2);

    FileInfo info = {.date = year + month + day,
                     .hour = hour,
                     .filename = year + month + day + "_" + hour + min + sec};

    return info;
}

std::string Utils::GenerateUuid() {
    uuid_t uuid;
    char uuid_str[37];
    uuid_generate(uuid);
    uuid_unparse_lower(uuid, uuid_str);
    return uuid_str;
}

double Utils::UnixTimeNow() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::microseconds>(now).count() / 1000000.0;
}

int64_t Utils::MonotonicTimeUs() {
    auto now = std::chrono::steady_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::microseconds>(now).count();
}

Buffer Utils::ConvertYuvToJpeg(const FrameBuffer &frame, int quality) {
    struct jpeg_compress_struct cinfo;
    struct jpeg_error_mgr jerr;

    Buffer jpeg_buffer;
    int width = frame.width();
    int height = frame.height();

    cinfo.err = jpeg_std_error(&jerr);
    jpeg_create_compress(&cinfo);
    uint8_t *data = nullptr;
    unsigned long size = 0;
    jpeg_mem_dest(&cinfo, &data, &size);

    cinfo.image_width = width;
    cinfo.image_height = height;
    cinfo.input_components = 3;
    // libyuv RGB24 is stored as B, G, R in memory.
    cinfo.in_color_space = JCS_EXT_BGR;

    jpeg_set_defaults(&cinfo);
    jpeg_set_quality(&cinfo, quality, TRUE);

    int row_stride = width * 3;
    std::vector<uint8_t> rgb_data(static_cast<size_t>(row_stride) * height);
    libyuv::I420ToRGB24(frame.DataY(), frame.StrideY(), frame.DataU(), frame.StrideU(),
                        frame.DataV(), frame.StrideV(), rgb_data.data(), row_stride, width,
                        height);

    jpeg_start_compress(&cinfo, TRUE);

    JSAMPROW row_pointer[1];
    while (cinfo.next_scanline < cinfo.image_height) {
        row_pointer[0] = &rgb_data[cinfo.next_scanline * row_stride];
        jpeg_write_scanlines(&cinfo, row_pointer, 1);
    }

    jpeg_finish_compress(&cinfo);
    jpeg_destroy_compress(&cinfo);

    jpeg_buffer.start = std::unique_ptr<uint8_t, FreeDeleter>(data);
    jpeg_buffer.length = size;

    return jpeg_buffer;
}

bool Utils::WriteJpegImage(const Buffer &buffer, const std::string &url) {
    FILE *file = fopen(url.c_str(), "wb");
    if (!file) {
        ERROR_PRINT("Failed to open file for writing: %s", url.c_str());
        return false;
    }

    size_t written = fwrite(buffer.start.get(), 1, buffer.length, file);
    fclose(file);
    if (written != buffer.length) {
        ERROR_PRINT("Short write on %s (%zu/%lu bytes)", url.c_str(), written, buffer.length);
        return false;
    }
    DEBUG_PRINT("JPEG data successfully written to %s", url.c_str());
    return true;
}

bool Utils::CreateJpegImage(const FrameBuffer &frame, const std::string &url, int quality) {
    auto jpg_buffer = Utils::ConvertYuvToJpeg(frame, quality);
    return WriteJpegImage(jpg_buffer, url);
}
