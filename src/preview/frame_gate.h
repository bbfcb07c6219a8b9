#ifndef FRAME_GATE_H_
#define FRAME_GATE_H_

#include <cstdint>
#include <mutex>

// Admits a frame once 1/fps of capture time has passed since the last admitted
// one, less 500 us of timestamp jitter.
class FrameGate {
  public:
    explicit FrameGate(int fps = 30);

    bool Admit(int64_t timestamp_us);
    void SetFps(int fps);
    int fps() const;
    void Reset();

  private:
    mutable std::mutex mtx_;
    int fps_;
    int64_t last_us_;
};

#endif // FRAME_GATE_H_
