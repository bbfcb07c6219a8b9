#include "common/errors.h"
#include "recorder/session_manager.h"
#include "recorder/timestamp_log.h"

#include <atomic>
#include <cassert>
#include <chrono>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

std::shared_ptr<FrameBuffer> Frame(int index, int width = 320, int height = 240) {
    auto frame = FrameBuffer::Create(width, height);
    frame->Fill(static_cast<uint8_t>(16 + (index * 7) % 200), 128, 128);
    frame->SetTimestamp(index * 33333LL);
    return frame;
}

std::vector<std::string> ReadLines(const std::string &path) {
    std::vector<std::string> lines;
    std::ifstream file(path);
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(line);
    }
    return lines;
}

RecorderConfig Config(const fs::path &dir) {
    RecorderConfig config;
    config.record_path = dir.string() + "/";
    config.min_free_mb = 1;
    config.queue_capacity = 64;
    config.space_check_interval_ms = 100;
    return config;
}

template <typename Fn> bool WaitFor(Fn condition, int timeout_ms = 3000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return condition();
}

void TestRecordingLayout(const fs::path &dir) {
    auto manager = SessionManager::Create(Config(dir));
    assert(!manager->session());
    assert(!manager->Stop());
    assert(!manager->OnFrame(Frame(0)));

    std::vector<SessionStatus> published;
    auto observer = manager->AsObservable();
    observer->Subscribe([&](RecordingSession &session) {
        published.push_back(session.status);
    });

    auto session = manager->Start("", 320, 240, 30);
    assert(session.status == SessionStatus::RECORDING);
    assert(manager->IsRecording());
    assert(session.id.size() == 36);
    assert(!session.encoder.empty());

    // <record_path>/<YYYYMMDD>/<YYYYMMDD_HHMMSS>_<id8>
    fs::path folder(session.output_path);
    auto name = folder.filename().string();
    auto date = folder.parent_path().filename().string();
    assert(folder.parent_path().parent_path() == dir);
    assert(date.size() == 8);
    assert(name.size() == 8 + 1 + 6 + 1 + 8);
    assert(name.compare(0, 8, date) == 0);
    assert(name.substr(16) == session.id.substr(0, 8));

    const int frames = 20;
    for (int i = 0; i < frames; i++) {
        assert(manager->OnFrame(Frame(i)));
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    auto stopped = manager->Stop();
    assert(stopped && stopped->status == SessionStatus::STOPPED);
    assert(stopped->frames_written == frames);
    assert(stopped->frames_dropped == 0);
    assert(stopped->stop_time && *stopped->stop_time >= stopped->start_time);
    assert(!stopped->error);
    assert(!manager->IsRecording());
    assert(!manager->OnFrame(Frame(99)));

    assert(fs::file_size(folder / "recording.mp4") > 0);
    assert(fs::file_size(folder / "recording.jpg") > 0);
    auto lines = ReadLines((folder / "timestamps.csv").string());
    assert(lines.size() == frames + 1);
    assert(lines[0] == "frame_idx,unix_time");
    assert(lines[1].rfind("0,", 0) == 0);
    assert(lines[frames].rfind(std::to_string(frames - 1) + ",", 0) == 0);
    // microsecond precision
    auto dot = lines[1].find('.');
    assert(dot != std::string::npos && lines[1].size() - dot - 1 == 6);

    // stopping again returns the last session untouched
    auto again = manager->Stop();
    assert(again && again->id == stopped->id && again->status == SessionStatus::STOPPED);

    assert(published.size() == 2);
    assert(published[0] == SessionStatus::RECORDING);
    assert(published[1] == SessionStatus::STOPPED);
}

void TestPreconditions(const fs::path &dir) {
    auto manager = SessionManager::Create(Config(dir));

    manager->SetSpaceProbe([](const std::string &path) -> std::optional<uint64_t> {
        return 512 * 1024;
    });
    bool refused = false;
    try {
        manager->Start("", 320, 240, 30);
    } catch (const RecordingError &e) {
        refused = true;
    }
    assert(refused);
    assert(!manager->session());

    manager->SetSpaceProbe(nullptr);
    manager->Start((dir / "custom").string(), 320, 240, 30);
    refused = false;
    try {
        manager->Start("", 320, 240, 30);
    } catch (const RecordingError &e) {
        refused = true;
    }
    assert(refused);
    assert(manager->IsRecording());

    auto session = manager->Stop();
    assert(session && session->output_path.rfind((dir / "custom").string(), 0) == 0);

    refused = false;
    try {
        manager->Start("", 0, 240, 30);
    } catch (const RecordingError &e) {
        refused = true;
    }
    assert(refused);
}

void TestBackpressure(const fs::path &dir) {
    auto config = Config(dir);
    config.queue_capacity = 1;
    auto manager = SessionManager::Create(config);
    manager->Start("", 1280, 720, 30);

    const int frames = 200;
    int queued = 0;
    auto frame = Frame(1, 1280, 720);
    for (int i = 0; i < frames; i++) {
        if (manager->OnFrame(frame)) {
            queued++;
        }
    }

    auto session = manager->Stop();
    assert(session && session->status == SessionStatus::STOPPED);
    assert(session->frames_dropped > 0);
    assert(session->frames_written == static_cast<uint64_t>(queued));
    assert(session->frames_written + session->frames_dropped == frames);
}

void TestStorageFull(const fs::path &dir) {
    auto manager = SessionManager::Create(Config(dir));
    manager->Start("", 320, 240, 30);
    assert(manager->OnFrame(Frame(0)));

    manager->SetSpaceProbe([](const std::string &path) -> std::optional<uint64_t> {
        return 0;
    });
    assert(WaitFor([&] {
        return !manager->IsRecording();
    }));

    auto session = manager->session();
    assert(session && session->status == SessionStatus::FAILED);
    assert(session->error && *session->error == "storage full");
    assert(!manager->OnFrame(Frame(1)));

    auto stopped = manager->Stop();
    assert(stopped && stopped->status == SessionStatus::FAILED);

    // the next session starts normally once space is back
    manager->SetSpaceProbe(nullptr);
    auto next = manager->Start("", 320, 240, 30);
    assert(next.status == SessionStatus::RECORDING && next.id != session->id);
    manager->Stop();
}

void TestNoEncoder(const fs::path &dir) {
    auto config = Config(dir);
    config.encoders = {"no_such_encoder"};
    auto manager = SessionManager::Create(config);

    std::vector<SessionStatus> published;
    auto observer = manager->AsObservable();
    observer->Subscribe([&](RecordingSession &session) {
        published.push_back(session.status);
    });

    bool refused = false;
    try {
        manager->Start("", 320, 240, 30);
    } catch (const RecordingError &e) {
        refused = std::string(e.what()) == "no usable video encoder";
    }
    assert(refused);

    auto session = manager->session();
    assert(session && session->status == SessionStatus::FAILED);
    assert(session->error && *session->error == "no usable video encoder");
    assert(!manager->IsRecording());
    assert(!manager->OnFrame(Frame(0)));
    assert(published.size() == 1 && published[0] == SessionStatus::FAILED);
}

// Returns the descriptor this process holds open on `path`, or -1.
int OpenDescriptor(const fs::path &path) {
    auto wanted = fs::canonical(path);
    std::error_code ec;
    for (auto &entry : fs::directory_iterator("/proc/self/fd", ec)) {
        std::error_code link_ec;
        auto target = fs::read_symlink(entry.path(), link_ec);
        if (!link_ec && target == wanted) {
            return std::stoi(entry.path().filename().string());
        }
    }
    return -1;
}

void TestTimestampWriteFailure(const fs::path &dir) {
    TimestampLog log;
    assert(log.Open("/dev/full"));
    assert(!log.Append(0, 1.0));
    log.Close();

    auto manager = SessionManager::Create(Config(dir));
    auto session = manager->Start("", 320, 240, 30);

    // the csv behaves like a full disk from now on
    int fd = OpenDescriptor(fs::path(session.output_path) / "timestamps.csv");
    assert(fd >= 0);
    int full = open("/dev/full", O_WRONLY);
    assert(full >= 0);
    assert(dup2(full, fd) == fd);
    close(full);

    assert(manager->OnFrame(Frame(0)));
    assert(WaitFor([&] {
        return !manager->IsRecording();
    }));

    auto failed = manager->session();
    assert(failed && failed->status == SessionStatus::FAILED);
    assert(failed->error && *failed->error == "cannot write timestamps");
    assert(failed->frames_written == 0);
    assert(!manager->OnFrame(Frame(1)));

    auto stopped = manager->Stop();
    assert(stopped && stopped->status == SessionStatus::FAILED);
}

void TestResizedFramesAreScaled(const fs::path &dir) {
    auto manager = SessionManager::Create(Config(dir));
    manager->Start("", 320, 240, 30);
    assert(manager->OnFrame(Frame(0, 320, 240)));
    assert(manager->OnFrame(Frame(1, 640, 240)));
    assert(manager->OnFrame(Frame(2, 160, 240)));
    auto session = manager->Stop();
    assert(session && session->frames_written == 3);
}

int main(int argc, char *argv[]) {
    auto dir = fs::temp_directory_path() / ("stereo_rig_recorder_" + std::to_string(getpid()));
    fs::create_directories(dir);

    TestRecordingLayout(dir);
    TestPreconditions(dir);
    TestBackpressure(dir);
    TestStorageFull(dir);
    TestResizedFramesAreScaled(dir);
    TestNoEncoder(dir);
    TestTimestampWriteFailure(dir);

    fs::remove_all(dir);
    std::cout << "test_recorder passed" << std::endl;
    return 0;
}
