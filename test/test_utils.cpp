#include "common/frame_buffer.h"
#include "common/utils.h"

#include <cassert>
#include <fstream>
#include <iostream>
#include <set>
#include <unistd.h>
#include <vector>

void TestNaming() {
    assert(Utils::PrefixZero(7, 2) == "07");
    assert(Utils::PrefixZero(2024, 2) == "2024");
    assert(Utils::PrefixZero(0, 3) == "000");

    auto info = Utils::GenerateFilename();
    assert(info.date.size() == 8);
    assert(info.hour.size() == 2);
    assert(info.filename.size() == 15);
    assert(info.filename.rfind(info.date + "_" + info.hour, 0) == 0);

    std::set<std::string> ids;
    for (int i = 0; i < 16; i++) {
        auto id = Utils::GenerateUuid();
        assert(id.size() == 36);
        assert(id[8] == '-' && id[13] == '-' && id[18] == '-' && id[23] == '-');
        ids.insert(id);
    }
    assert(ids.size() == 16);
}

void TestFilesystem() {
    auto dir = fs::temp_directory_path() / ("stereo_rig_utils_" + std::to_string(getpid()));
    auto nested = (dir / "a" / "b").string();
    assert(Utils::CreateFolder(nested));
    assert(fs::is_directory(nested));
    assert(Utils::CreateFolder(nested));

    assert(Utils::CheckDriveSpace(dir.string(), 0));
    assert(!Utils::CheckDriveSpace(dir.string(), ~0UL));
    auto free_bytes = Utils::GetFreeSpaceBytes(dir.string());
    assert(free_bytes && *free_bytes > 0);

    auto file = (dir / "value").string();
    {
        std::ofstream out(file);
        out << "42000\nsecond line\n";
    }
    auto line = Utils::ReadFirstLine(file);
    assert(line && *line == "42000");
    assert(!Utils::ReadFirstLine((dir / "missing").string()));

    fs::remove_all(dir);
}

void TestJpeg() {
    auto frame = FrameBuffer::Create(64, 48);
    frame->Fill(128, 90, 200);
    auto jpeg = Utils::ConvertYuvToJpeg(*frame, 75);
    assert(jpeg.length > 4);
    assert(jpeg.start.get()[0] == 0xFF && jpeg.start.get()[1] == 0xD8);
    assert(jpeg.start.get()[jpeg.length - 2] == 0xFF && jpeg.start.get()[jpeg.length - 1] == 0xD9);
}

void TestFrameBuffer() {
    auto frame = FrameBuffer::Create(5, 3);
    assert(frame->StrideY() == 5 && frame->StrideU() == 3 && frame->StrideV() == 3);
    assert(frame->ChromaHeight() == 2);
    assert(frame->size() == 5 * 3 + 2 * 3 * 2);

    const int width = 4, height = 2;
    std::vector<uint8_t> i420(width * height * 3 / 2, 0);
    for (int i = 0; i < width * height; i++) {
        i420[i] = static_cast<uint8_t>(i * 10);
    }
    V4l2Buffer raw(i420.data(), i420.size(), 0, {3, 500});
    auto converted = FrameBuffer::FromRaw(raw, width, height, V4L2_PIX_FMT_YUV420);
    assert(converted);
    assert(converted->timestamp_us() == 3000500);
    assert(converted->DataY()[5] == 50);

    V4l2Buffer truncated(i420.data(), width * height, 0, {0, 0});
    assert(!FrameBuffer::FromRaw(truncated, width, height, V4L2_PIX_FMT_YUV420));

    // Y0 U Y1 V per pixel pair.
    std::vector<uint8_t> yuyv(width * height * 2);
    for (size_t i = 0; i < yuyv.size(); i += 4) {
        yuyv[i] = 100;
        yuyv[i + 1] = 128;
        yuyv[i + 2] = 110;
        yuyv[i + 3] = 128;
    }
    V4l2Buffer packed(yuyv.data(), yuyv.size(), 0, {0, 0});
    auto unpacked = FrameBuffer::FromRaw(packed, width, height, V4L2_PIX_FMT_YUYV);
    assert(unpacked);
    assert(unpacked->DataY()[0] == 100 && unpacked->DataY()[1] == 110);
    assert(unpacked->DataU()[0] == 128);

    assert(!FrameBuffer::FromRaw(packed, width, height, V4L2_PIX_FMT_H264));
}

int main(int argc, char *argv[]) {
    TestNaming();
    TestFilesystem();
    TestJpeg();
    TestFrameBuffer();

    std::cout << "test_utils passed" << std::endl;
    return 0;
}
