#include "capturer/fake_capturer.h"
#include "common/errors.h"
#include "coordinator.h"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

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

Args TestArgs(const fs::path &dir) {
    Args args;
    args.source = "fake";
    args.width = 640;
    args.height = 480;
    args.fps = 30;
    args.record_fps = 15;
    args.record_path = dir.string() + "/";
    args.min_free_mb = 1;
    args.stats_interval_ms = 100;
    args.thermal_path = (dir / "no_thermal_zone").string();
    return args;
}

template <typename E, typename Fn> bool Throws(Fn fn) {
    try {
        fn();
    } catch (const E &e) {
        return true;
    }
    return false;
}

void TestPreviewLifecycle(const fs::path &dir) {
    auto coordinator = Coordinator::Create(TestArgs(dir));
    assert(!coordinator->IsPreviewing());
    assert(!coordinator->LatestPreviewFrame());
    assert(!coordinator->LatestPreviewJpeg());
    assert(Throws<RecordingError>([&] { coordinator->StartRecording(); }));
    assert(Throws<RecordingError>([&] { coordinator->Snapshot(); }));

    coordinator->StartPreview();
    assert(coordinator->IsPreviewing());
    // starting twice is harmless
    coordinator->StartPreview();

    assert(WaitFor([&] {
        return coordinator->LatestPreviewFrame() != nullptr;
    }));
    auto frame = coordinator->LatestPreviewFrame();
    assert(frame->width() == 640 * 3 && frame->height() == 480);

    auto jpeg = coordinator->LatestPreviewJpeg();
    assert(jpeg && jpeg->length > 4);
    assert(jpeg->start.get()[0] == 0xFF && jpeg->start.get()[1] == 0xD8);

    auto snapshot = coordinator->Snapshot();
    assert(fs::exists(snapshot));
    assert(fs::path(snapshot).parent_path() == dir / "snapshots");
    // snapshots within the same second keep both files
    auto second = coordinator->Snapshot();
    assert(second != snapshot && fs::exists(second) && fs::exists(snapshot));

    // a few status polls with a live preview
    std::this_thread::sleep_for(std::chrono::milliseconds(1300));
    auto status = coordinator->Status();
    assert(status.preview_fps && *status.preview_fps > 20.0);
    assert(status.capture_fps && *status.capture_fps > 20.0);
    assert(!status.cpu_temp_c);
    assert(status.free_gb);
    assert(!status.recording);

    coordinator->StopPreview();
    assert(!coordinator->IsPreviewing());
    status = coordinator->Status();
    assert(!status.preview_fps);
}

void TestLiveParameters(const fs::path &dir) {
    auto coordinator = Coordinator::Create(TestArgs(dir));
    coordinator->StartPreview();

    ParameterPatch view;
    view.show_right = false;
    auto params = coordinator->UpdateParameters(view);
    assert(!params.show_right && params.show_disparity);
    assert(WaitFor([&] {
        auto frame = coordinator->LatestPreviewFrame();
        return frame && frame->width() == 640 * 2;
    }));

    ParameterPatch invalid;
    invalid.fps = 500;
    invalid.show_disparity = false;
    assert(Throws<ParameterError>([&] { coordinator->UpdateParameters(invalid); }));
    assert(coordinator->Parameters().fps == 30);
    assert(coordinator->Parameters().show_disparity);

    ParameterPatch resolution;
    resolution.width = 960;
    resolution.height = 540;
    coordinator->UpdateParameters(resolution);
    assert(coordinator->IsPreviewing());
    assert(WaitFor([&] {
        auto frame = coordinator->LatestPreviewFrame();
        return frame && frame->width() == 960 * 2 && frame->height() == 540;
    }));

    ParameterPatch fps;
    fps.fps = 10;
    coordinator->UpdateParameters(fps);
    auto stereo = coordinator->stereo_source();
    assert(stereo && stereo->left()->fps() == 10 && stereo->right()->fps() == 10);

    coordinator->Shutdown();
    assert(!coordinator->IsPreviewing());
}

void TestFailedRestartKeepsParameters(const fs::path &dir) {
    auto coordinator = Coordinator::Create(TestArgs(dir));
    coordinator->SetCapturerFactory(
        [](const CaptureConfig &config) -> std::shared_ptr<VideoCapturer> {
            if (config.width == 1280) {
                throw CaptureError(config.name + " camera cannot stream 1280x720");
            }
            return FakeCapturer::Create(config);
        });
    coordinator->StartPreview();
    assert(WaitFor([&] {
        return coordinator->LatestPreviewFrame() != nullptr;
    }));

    ParameterPatch patch;
    patch.width = 1280;
    patch.height = 720;
    patch.show_right = false;
    assert(Throws<CaptureError>([&] { coordinator->UpdateParameters(patch); }));

    auto params = coordinator->Parameters();
    assert(params.width == 640 && params.height == 480);
    assert(params.show_right);
    assert(coordinator->IsPreviewing());
    assert(WaitFor([&] {
        auto frame = coordinator->LatestPreviewFrame();
        return frame && frame->width() == 640 * 3 && frame->height() == 480;
    }));

    // a supported change still goes through afterwards
    ParameterPatch resolution;
    resolution.width = 960;
    resolution.height = 540;
    coordinator->UpdateParameters(resolution);
    assert(coordinator->Parameters().width == 960);
    assert(coordinator->IsPreviewing());

    coordinator->Shutdown();
}

void TestRecording(const fs::path &dir) {
    auto coordinator = Coordinator::Create(TestArgs(dir));
    coordinator->StartPreview();
    assert(WaitFor([&] {
        return coordinator->LatestPreviewFrame() != nullptr;
    }));

    auto session = coordinator->StartRecording();
    assert(session.status == SessionStatus::RECORDING);
    assert(session.width == 640 * 3 && session.height == 480 && session.fps == 15);
    assert(Throws<RecordingError>([&] { coordinator->StartRecording(); }));

    ParameterPatch resolution;
    resolution.width = 1280;
    resolution.height = 720;
    bool locked = false;
    try {
        coordinator->UpdateParameters(resolution);
    } catch (const ParameterError &e) {
        locked = e.reason() == ParameterError::Reason::LOCKED;
    }
    assert(locked);
    assert(coordinator->Parameters().width == 640);

    // other parameters still apply while recording
    ParameterPatch exposure;
    exposure.exposure_us = 8000;
    coordinator->UpdateParameters(exposure);
    assert(coordinator->Status().recording);

    std::this_thread::sleep_for(std::chrono::seconds(1));
    auto stopped = coordinator->StopRecording();
    assert(stopped && stopped->status == SessionStatus::STOPPED);
    // record gate at 15 fps over roughly one second
    assert(stopped->frames_written >= 5 && stopped->frames_written <= 20);
    assert(fs::exists(fs::path(stopped->output_path) / "recording.mp4"));
    assert(fs::exists(fs::path(stopped->output_path) / "timestamps.csv"));
    assert(fs::exists(fs::path(stopped->output_path) / "recording.jpg"));

    // the lock is released with the session
    coordinator->UpdateParameters(resolution);
    assert(coordinator->Parameters().width == 1280);

    // stopping the preview ends an active recording first
    coordinator->StartRecording();
    coordinator->StopPreview();
    auto last = coordinator->Recording();
    assert(last && last->status == SessionStatus::STOPPED);
}

int main(int argc, char *argv[]) {
    auto dir = fs::temp_directory_path() / ("stereo_rig_coordinator_" + std::to_string(getpid()));
    fs::create_directories(dir);

    TestPreviewLifecycle(dir);
    TestLiveParameters(dir);
    TestFailedRestartKeepsParameters(dir);
    TestRecording(dir);

    fs::remove_all(dir);
    std::cout << "test_coordinator passed" << std::endl;
    return 0;
}
