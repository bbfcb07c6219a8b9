#ifndef V4L2_CAPTURER_H_
#define V4L2_CAPTURER_H_

#include <atomic>
#include <mutex>

#include "capturer/video_capturer.h"
#include "common/v4l2_utils.h"
#include "common/worker.h"

class V4l2Capturer : public VideoCapturer {
  public:
    static std::shared_ptr<V4l2Capturer> Create(CaptureConfig config);

    V4l2Capturer(CaptureConfig config);
    ~V4l2Capturer();
    std::string name() const override;
    int fps() const override;
    int width() const override;
    int height() const override;
    uint32_t format() const override;
    bool is_capturing() const override;
    void StartCapture() override;
    void StopCapture() override;
    bool SetFps(int fps) override;
    bool SetExposure(int exposure_us, float gain) override;

  private:
    int fd_;
    int buffer_count_;
    std::atomic<bool> capturing_;
    CaptureConfig config_;
    V4l2BufferGroup capture_;
    std::mutex control_mtx_;
    std::unique_ptr<Worker> worker_;

    void Init();
    void CaptureImage();
};

#endif
