#include "capturer/fake_capturer.h"

#include <algorithm>
#include <cmath>
#include <thread>

#include "common/logging.h"
#include "common/utils.h"

namespace {
const int kDiscRadius = 35;
// BGR(0, 255, 255) in BT.601 limited range
const uint8_t kDiscY = 210, kDiscU = 16, kDiscV = 146;
const uint8_t kBackgroundY = 24, kNeutralChroma = 128;
} // namespace

std::shared_ptr<FakeCapturer> FakeCapturer::Create(CaptureConfig config) {
    auto ptr = std::make_shared<FakeCapturer>(config);
    INFO_PRINT("%s: synthetic %dx%d@%d, shift %dpx", config.name.c_str(), config.width,
               config.height, config.fps, config.shift_px);
    return ptr;
}

FakeCapturer::FakeCapturer(CaptureConfig config)
    : config_(config),
      fps_(config.fps),
      exposure_(config.exposure),
      capturing_(false) {}

FakeCapturer::~FakeCapturer() { StopCapture(); }

std::string FakeCapturer::name() const { return config_.name; }

int FakeCapturer::fps() const { return fps_.load(); }

int FakeCapturer::width() const { return config_.width; }

int FakeCapturer::height() const { return config_.height; }

uint32_t FakeCapturer::format() const { return V4L2_PIX_FMT_YUV420; }

bool FakeCapturer::is_capturing() const { return capturing_.load(); }

std::shared_ptr<FrameBuffer> FakeCapturer::Render(int64_t timestamp_us) const {
    int w = config_.width;
    int h = config_.height;
    auto frame = FrameBuffer::Create(w, h);
    frame->SetTimestamp(timestamp_us);

    // a manual exposure dims or brightens the background like a real sensor would
    int exposure = exposure_.load();
    uint8_t background = kBackgroundY;
    if (exposure > 0) {
        background = static_cast<uint8_t>(std::clamp(exposure / 200, 16, 120));
    }
    frame->Fill(background, kNeutralChroma, kNeutralChroma);

    double t = (timestamp_us % 600000000LL) / 1000000.0;
    int cx = static_cast<int>(w * 0.5 + w * 0.25 * std::sin(t)) + config_.shift_px;
    int cy = static_cast<int>(h * 0.5 + h * 0.15 * std::cos(t * 0.7));

    for (int y = std::max(0, cy - kDiscRadius); y < std::min(h, cy + kDiscRadius + 1); y++) {
        for (int x = std::max(0, cx - kDiscRadius); x < std::min(w, cx + kDiscRadius + 1); x++) {
            int dx = x - cx;
            int dy = y - cy;
            if (dx * dx + dy * dy > kDiscRadius * kDiscRadius) {
                continue;
            }
            frame->MutableDataY()[y * frame->StrideY() + x] = kDiscY;
            if ((x % 2) == 0 && (y % 2) == 0) {
                frame->MutableDataU()[(y / 2) * frame->StrideU() + x / 2] = kDiscU;
                frame->MutableDataV()[(y / 2) * frame->StrideV() + x / 2] = kDiscV;
            }
        }
    }

    return frame;
}

void FakeCapturer::CaptureImage() {
    int64_t period_us = 1000000 / std::max(1, fps_.load());
    int64_t now = Utils::MonotonicTimeUs();
    int64_t next = (now / period_us + 1) * period_us;

    // sleep in short slices so StopCapture is not held up by slow frame rates
    int64_t remaining = next - now;
    while (remaining > 0 && capturing_.load()) {
        std::this_thread::sleep_for(std::chrono::microseconds(std::min<int64_t>(remaining, 20000)));
        remaining = next - Utils::MonotonicTimeUs();
    }
    if (!capturing_.load()) {
        return;
    }

    NextFrameBuffer(Render(next));
}

void FakeCapturer::StartCapture() {
    if (capturing_.exchange(true)) {
        return;
    }
    worker_.reset(new Worker(config_.name, [this]() {
        CaptureImage();
    }));
    worker_->Run();
}

void FakeCapturer::StopCapture() {
    if (!capturing_.exchange(false)) {
        return;
    }
    worker_.reset();
}

bool FakeCapturer::SetFps(int fps) {
    if (fps <= 0) {
        return false;
    }
    fps_.store(fps);
    return true;
}

bool FakeCapturer::SetExposure(int exposure_us, float gain) {
    exposure_.store(exposure_us);
    return true;
}
