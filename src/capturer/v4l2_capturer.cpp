#include "capturer/v4l2_capturer.h"

#include <errno.h>
#include <sys/select.h>

#include "common/errors.h"
#include "common/logging.h"

std::shared_ptr<V4l2Capturer> V4l2Capturer::Create(CaptureConfig config) {
    auto ptr = std::make_shared<V4l2Capturer>(config);
    ptr->Init();
    return ptr;
}

V4l2Capturer::V4l2Capturer(CaptureConfig config)
    : fd_(-1),
      buffer_count_(4),
      capturing_(false),
      config_(config) {}

V4l2Capturer::~V4l2Capturer() {
    StopCapture();
    V4l2Util::CloseDevice(fd_);
}

void V4l2Capturer::Init() {
    auto formats = V4l2Util::GetDeviceSupportedFormats(config_.device.c_str());
    auto fourcc = V4l2Util::FourccToString(config_.format);
    if (!formats.empty() && formats.find(fourcc) == formats.end()) {
        throw CaptureError(config_.device + " does not list " + fourcc);
    }

    fd_ = V4l2Util::OpenDevice(config_.device.c_str());
    if (fd_ < 0) {
        throw CaptureError("cannot open " + config_.device);
    }

    if (!V4l2Util::InitBuffer(fd_, &capture_, V4L2_BUF_TYPE_VIDEO_CAPTURE, V4L2_MEMORY_MMAP)) {
        throw CaptureError(config_.device + " is not a capture device");
    }

    if (!V4l2Util::SetFormat(fd_, &capture_, config_.width, config_.height, config_.format)) {
        throw CaptureError(config_.device + " does not support " +
                           V4l2Util::FourccToString(config_.format));
    }

    V4l2Util::SetFps(fd_, capture_.type, config_.fps);
    if (config_.exposure > 0) {
        V4l2Util::SetExposure(fd_, config_.exposure);
    }

    INFO_PRINT("%s: %s %dx%d@%d (%s)", config_.name.c_str(), config_.device.c_str(),
               config_.width, config_.height, config_.fps,
               V4l2Util::FourccToString(config_.format).c_str());
}

std::string V4l2Capturer::name() const { return config_.name; }

int V4l2Capturer::fps() const { return config_.fps; }

int V4l2Capturer::width() const { return config_.width; }

int V4l2Capturer::height() const { return config_.height; }

uint32_t V4l2Capturer::format() const { return config_.format; }

bool V4l2Capturer::is_capturing() const { return capturing_.load(); }

void V4l2Capturer::CaptureImage() {
    fd_set fds;
    FD_ZERO(&fds);
    FD_SET(fd_, &fds);
    timeval tv = {};
    tv.tv_sec = 0;
    tv.tv_usec = 500000;
    int r = select(fd_ + 1, &fds, NULL, NULL, &tv);
    if (r == -1) {
        if (errno != EINTR) {
            ERROR_PRINT("%s select failed", config_.name.c_str());
        }
        return;
    } else if (r == 0) {
        DEBUG_PRINT("%s capture timeout", config_.name.c_str());
        return;
    }

    v4l2_buffer buf = {};
    buf.type = capture_.type;
    buf.memory = capture_.memory;

    if (!V4l2Util::DequeueBuffer(fd_, &buf)) {
        return;
    }

    V4l2Buffer buffer(capture_.buffers[buf.index].start, buf.bytesused, buf.flags,
                      buf.timestamp);
    auto frame_buffer =
        FrameBuffer::FromRaw(buffer, config_.width, config_.height, config_.format);

    // The frame is converted into its own memory, so the slot can go back now.
    V4l2Util::QueueBuffer(fd_, &buf);

    if (frame_buffer) {
        NextFrameBuffer(frame_buffer);
    }
}

void V4l2Capturer::StartCapture() {
    std::lock_guard<std::mutex> lock(control_mtx_);
    if (capturing_.load()) {
        return;
    }

    if (!V4l2Util::AllocateBuffer(fd_, &capture_, buffer_count_) ||
        !V4l2Util::QueueBuffers(fd_, &capture_)) {
        V4l2Util::DeallocateBuffer(fd_, &capture_);
        throw CaptureError("cannot allocate buffers on " + config_.device);
    }

    if (!V4l2Util::StreamOn(fd_, capture_.type)) {
        V4l2Util::DeallocateBuffer(fd_, &capture_);
        throw CaptureError("cannot stream on " + config_.device);
    }

    capturing_.store(true);
    worker_.reset(new Worker(config_.name, [this]() {
        CaptureImage();
    }));
    worker_->Run();
}

void V4l2Capturer::StopCapture() {
    std::lock_guard<std::mutex> lock(control_mtx_);
    if (!capturing_.load()) {
        return;
    }

    worker_.reset();
    V4l2Util::StreamOff(fd_, capture_.type);
    V4l2Util::DeallocateBuffer(fd_, &capture_);
    capturing_.store(false);
}

bool V4l2Capturer::SetFps(int fps) {
    bool was_capturing = capturing_.load();
    // Most uvc drivers refuse S_PARM while buffers are allocated.
    if (was_capturing) {
        StopCapture();
    }

    bool ok = V4l2Util::SetFps(fd_, capture_.type, fps);
    if (ok) {
        config_.fps = fps;
    }

    if (was_capturing) {
        StartCapture();
    }
    return ok;
}

bool V4l2Capturer::SetExposure(int exposure_us, float gain) {
    std::lock_guard<std::mutex> lock(control_mtx_);
    bool ok = V4l2Util::SetExposure(fd_, exposure_us);
    if (gain > 0.0f) {
        // uvc gain is a unitless driver range, treat the value as x100.
        ok = V4l2Util::SetCtrl(fd_, V4L2_CID_GAIN, static_cast<int32_t>(gain * 100)) && ok;
    }
    if (ok) {
        config_.exposure = exposure_us;
        config_.gain = gain;
    }
    return ok;
}
