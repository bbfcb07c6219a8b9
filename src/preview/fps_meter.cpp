#include "preview/fps_meter.h"

#include "common/utils.h"

FpsMeter::FpsMeter(int64_t window_us)
    : window_us_(window_us),
      window_start_us_(-1),
      window_count_(0),
      total_(0),
      fps_(0.0) {}

void FpsMeter::Tick() { Tick(Utils::MonotonicTimeUs()); }

void FpsMeter::Tick(int64_t now_us) {
    std::lock_guard<std::mutex> lock(mtx_);
    total_++;
    if (window_start_us_ < 0) {
        window_start_us_ = now_us;
        return;
    }

    window_count_++;
    int64_t elapsed = now_us - window_start_us_;
    if (elapsed >= window_us_) {
        fps_ = window_count_ * 1000000.0 / elapsed;
        window_count_ = 0;
        window_start_us_ = now_us;
    }
}

double FpsMeter::fps() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return fps_;
}

uint64_t FpsMeter::frames() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return total_;
}

void FpsMeter::Reset() {
    std::lock_guard<std::mutex> lock(mtx_);
    window_start_us_ = -1;
    window_count_ = 0;
    total_ = 0;
    fps_ = 0.0;
}
