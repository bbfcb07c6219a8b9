#ifndef LIBCAMERA_CAPTURER_H_
#define LIBCAMERA_CAPTURER_H_

#include <atomic>
#include <map>
#include <mutex>
#include <vector>

#include <libcamera/libcamera.h>

#include "capturer/video_capturer.h"

class LibcameraCapturer : public VideoCapturer {
  public:
    static std::shared_ptr<LibcameraCapturer> Create(CaptureConfig config);

    LibcameraCapturer(CaptureConfig config);
    ~LibcameraCapturer();
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
    int stride_;
    int buffer_count_;
    std::atomic<bool> capturing_;
    CaptureConfig config_;
    std::mutex mtx_;

    std::shared_ptr<libcamera::CameraManager> cm_;
    std::shared_ptr<libcamera::Camera> camera_;
    std::unique_ptr<libcamera::CameraConfiguration> camera_config_;
    std::unique_ptr<libcamera::FrameBufferAllocator> allocator_;
    std::vector<std::unique_ptr<libcamera::Request>> requests_;
    libcamera::Stream *stream_;
    libcamera::ControlList controls_;
    std::map<int, std::pair<void *, unsigned int>> mapped_buffers_;

    // libcamera allows a single CameraManager per process, both cameras share it.
    static std::shared_ptr<libcamera::CameraManager> AcquireCameraManager();

    void Init();
    void SetFormat(int width, int height);
    void AllocateBuffer();
    void ReleaseBuffer();
    void QueueFrameControls(int fps, int exposure_us, float gain);
    void RequestComplete(libcamera::Request *request);
};

#endif
