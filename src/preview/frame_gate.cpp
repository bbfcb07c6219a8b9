#include "preview/frame_gate.h"

namespace {

// timestamp jitter tolerated below the frame period
const int64_t kJitterUs = 500;

} // namespace

FrameGate::FrameGate(int fps)
    : fps_(fps),
      last_us_(-1) {}

bool FrameGate::Admit(int64_t timestamp_us) {
    std::lock_guard<std::mutex> lock(mtx_);
    int64_t min_gap_us = fps_ > 0 ? 1000000 / fps_ - kJitterUs : 0;
    if (last_us_ >= 0 && timestamp_us >= last_us_ && timestamp_us - last_us_ < min_gap_us) {
        return false;
    }
    last_us_ = timestamp_us;
    return true;
}

void FrameGate::SetFps(int fps) {
    std::lock_guard<std::mutex> lock(mtx_);
    fps_ = fps;
}

int FrameGate::fps() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return fps_;
}

void FrameGate::Reset() {
    std::lock_guard<std::mutex> lock(mtx_);
    last_us_ = -1;
}
