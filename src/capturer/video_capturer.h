#ifndef VIDEO_CAPTURER_H_
#define VIDEO_CAPTURER_H_

#include <memory>
#include <string>

#include <linux/videodev2.h>

#include "common/frame_buffer.h"
#include "common/interface/subject.h"

struct CaptureConfig {
    std::string name = "camera";
    std::string device = "/dev/video0";
    int camera_index = 0;
    int width = 848;
    int height = 480;
    int fps = 30;
    uint32_t format = V4L2_PIX_FMT_MJPEG;
    int exposure = 0;
    float gain = 0.0f;
    // synthetic horizontal disparity, only used by FakeCapturer
    int shift_px = 0;
};

class VideoCapturer {
  public:
    using FrameBufferPtr = std::shared_ptr<FrameBuffer>;

    VideoCapturer() = default;
    virtual ~VideoCapturer() { frame_buffer_subject_.UnSubscribe(); };

    virtual std::string name() const = 0;
    virtual int fps() const = 0;
    virtual int width() const = 0;
    virtual int height() const = 0;
    virtual uint32_t format() const = 0;
    virtual bool is_capturing() const = 0;
    // Throws CaptureError when the device cannot be started.
    virtual void StartCapture() = 0;
    virtual void StopCapture() = 0;
    virtual bool SetFps(int fps) = 0;
    virtual bool SetExposure(int exposure_us, float gain) = 0;

    std::shared_ptr<Observable<FrameBufferPtr>> AsFrameBufferObservable() {
        return frame_buffer_subject_.AsObservable();
    };

  protected:
    void NextFrameBuffer(FrameBufferPtr frame_buffer) {
        frame_buffer_subject_.Next(frame_buffer);
    };

  private:
    Subject<FrameBufferPtr> frame_buffer_subject_;
};

#endif
