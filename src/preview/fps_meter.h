#ifndef FPS_METER_H_
#define FPS_METER_H_

#include <cstdint>
#include <mutex>

// Frame rate over windows of at least `window_us`, updated when a window closes.
class FpsMeter {
  public:
    explicit FpsMeter(int64_t window_us = 1000000);

    void Tick(int64_t now_us);
    void Tick();
    double fps() const;
    uint64_t frames() const;
    void Reset();

  private:
    mutable std::mutex mtx_;
    const int64_t window_us_;
    int64_t window_start_us_;
    uint64_t window_count_;
    uint64_t total_;
    double fps_;
};

#endif // FPS_METER_H_
