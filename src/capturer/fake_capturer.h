#ifndef FAKE_CAPTURER_H_
#define FAKE_CAPTURER_H_

#include <atomic>

#include "capturer/video_capturer.h"
#include "common/worker.h"

/*
 * Synthetic camera drawing a moving disc. Frames are emitted on a shared
 * clock grid, so two fake cameras with the same fps produce identical
 * timestamps. The right camera is created with `shift_px` to simulate a
 * constant horizontal disparity.
 */
class FakeCapturer : public VideoCapturer {
  public:
    static std::shared_ptr<FakeCapturer> Create(CaptureConfig config);

    FakeCapturer(CaptureConfig config);
    ~FakeCapturer();
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

    // Draws the frame the camera would emit at `timestamp_us`.
    std::shared_ptr<FrameBuffer> Render(int64_t timestamp_us) const;

  private:
    CaptureConfig config_;
    std::atomic<int> fps_;
    std::atomic<int> exposure_;
    std::atomic<bool> capturing_;
    std::unique_ptr<Worker> worker_;

    void CaptureImage();
};

#endif
