#include "capturer/libcamera_capturer.h"

#include <algorithm>
#include <sys/mman.h>

#include "common/errors.h"
#include "common/logging.h"

std::shared_ptr<libcamera::CameraManager> LibcameraCapturer::AcquireCameraManager() {
    static std::mutex mtx;
    static std::weak_ptr<libcamera::CameraManager> shared;

    std::lock_guard<std::mutex> lock(mtx);
    auto cm = shared.lock();
    if (!cm) {
        cm = std::shared_ptr<libcamera::CameraManager>(new libcamera::CameraManager(),
                                                       [](libcamera::CameraManager *manager) {
                                                           manager->stop();
                                                           delete manager;
                                                       });
        if (cm->start() < 0) {
            throw CaptureError("libcamera camera manager failed to start");
        }
        shared = cm;
    }
    return cm;
}

std::shared_ptr<LibcameraCapturer> LibcameraCapturer::Create(CaptureConfig config) {
    auto ptr = std::make_shared<LibcameraCapturer>(config);
    ptr->Init();
    ptr->SetFormat(config.width, config.height);
    ptr->QueueFrameControls(config.fps, config.exposure, config.gain);
    return ptr;
}

LibcameraCapturer::LibcameraCapturer(CaptureConfig config)
    : stride_(0),
      buffer_count_(4),
      capturing_(false),
      config_(config),
      stream_(nullptr) {}

void LibcameraCapturer::Init() {
    cm_ = AcquireCameraManager();

    auto cameras = cm_->cameras();
    if (config_.camera_index < 0 || config_.camera_index >= static_cast<int>(cameras.size())) {
        throw CaptureError("libcamera has " + std::to_string(cameras.size()) +
                           " camera(s), index " + std::to_string(config_.camera_index) +
                           " is not available");
    }

    std::string camera_id = cameras[config_.camera_index]->id();
    INFO_PRINT("%s: libcamera id %s", config_.name.c_str(), camera_id.c_str());
    camera_ = cm_->get(camera_id);
    if (camera_->acquire() < 0) {
        throw CaptureError("camera " + camera_id + " is busy");
    }
    camera_config_ = camera_->generateConfiguration({libcamera::StreamRole::VideoRecording});
}

LibcameraCapturer::~LibcameraCapturer() {
    StopCapture();
    if (camera_) {
        camera_->release();
        camera_.reset();
    }
}

std::string LibcameraCapturer::name() const { return config_.name; }

int LibcameraCapturer::fps() const { return config_.fps; }

int LibcameraCapturer::width() const { return config_.width; }

int LibcameraCapturer::height() const { return config_.height; }

uint32_t LibcameraCapturer::format() const { return V4L2_PIX_FMT_YUV420; }

bool LibcameraCapturer::is_capturing() const { return capturing_.load(); }

void LibcameraCapturer::SetFormat(int width, int height) {
    DEBUG_PRINT("camera original format: %s", camera_config_->at(0).toString().c_str());

    camera_config_->at(0).size = libcamera::Size(width, height);
    camera_config_->at(0).pixelFormat = libcamera::formats::YUV420;
    camera_config_->at(0).bufferCount = buffer_count_;

    auto validation = camera_config_->validate();
    if (validation == libcamera::CameraConfiguration::Status::Valid) {
        INFO_PRINT("%s validated format: %s.", config_.name.c_str(),
                   camera_config_->at(0).toString().c_str());
    } else if (validation == libcamera::CameraConfiguration::Status::Adjusted) {
        INFO_PRINT("%s adjusted format: %s.", config_.name.c_str(),
                   camera_config_->at(0).toString().c_str());
    } else {
        throw CaptureError("failed to validate camera configuration of " + config_.name);
    }

    config_.width = camera_config_->at(0).size.width;
    config_.height = camera_config_->at(0).size.height;
    stride_ = camera_config_->at(0).stride;

    INFO_PRINT("  width: %d, height: %d, stride: %d", config_.width, config_.height, stride_);
}

void LibcameraCapturer::QueueFrameControls(int fps, int exposure_us, float gain) {
    std::lock_guard<std::mutex> lock(mtx_);
    int64_t frame_time = 1000000 / fps;
    controls_.set(libcamera::controls::FrameDurationLimits,
                  libcamera::Span<const int64_t, 2>({frame_time, frame_time}));

    if (exposure_us > 0) {
        controls_.set(libcamera::controls::AeEnable, false);
        controls_.set(libcamera::controls::ExposureTime, std::min<int>(exposure_us, frame_time));
        controls_.set(libcamera::controls::AnalogueGain, gain > 0.0f ? gain : 1.0f);
    } else {
        controls_.set(libcamera::controls::AeEnable, true);
        if (gain > 0.0f) {
            controls_.set(libcamera::controls::AnalogueGain, gain);
        }
    }

    config_.fps = fps;
    config_.exposure = exposure_us;
    config_.gain = gain;
    DEBUG_PRINT("  Fps: %d, exposure: %dus, gain: %.2f", fps, exposure_us, gain);
}

bool LibcameraCapturer::SetFps(int fps) {
    QueueFrameControls(fps, config_.exposure, config_.gain);
    return true;
}

bool LibcameraCapturer::SetExposure(int exposure_us, float gain) {
    QueueFrameControls(config_.fps, exposure_us, gain);
    return true;
}

void LibcameraCapturer::AllocateBuffer() {
    allocator_ = std::make_unique<libcamera::FrameBufferAllocator>(camera_);

    stream_ = camera_config_->at(0).stream();
    if (allocator_->allocate(stream_) < 0) {
        throw CaptureError("can't allocate buffers for " + config_.name);
    }

    auto &buffers = allocator_->buffers(stream_);
    for (unsigned int i = 0; i < buffers.size(); i++) {
        auto &buffer = buffers[i];
        int fd = 0;
        unsigned int buffer_length = 0;
        for (auto &plane : buffer->planes()) {
            fd = plane.fd.get();
            buffer_length += plane.length;
        }
        void *memory = mmap(NULL, buffer_length, PROT_READ | PROT_WRITE, MAP_SHARED, fd, 0);
        if (memory == MAP_FAILED) {
            throw CaptureError("can't map buffer of " + config_.name);
        }
        mapped_buffers_[fd] = std::make_pair(memory, buffer_length);
        DEBUG_PRINT("Allocated fd(%d) Buffer[%d] pointer: %p, length: %u", fd, i, memory,
                    buffer_length);

        auto request = camera_->createRequest();
        if (!request) {
            throw CaptureError("can't create camera request for " + config_.name);
        }
        if (request->addBuffer(stream_, buffer.get()) < 0) {
            throw CaptureError("can't set buffer for request of " + config_.name);
        }
        requests_.push_back(std::move(request));
    }
}

void LibcameraCapturer::ReleaseBuffer() {
    requests_.clear();
    for (auto &[fd, mapped] : mapped_buffers_) {
        munmap(mapped.first, mapped.second);
    }
    mapped_buffers_.clear();
    if (allocator_ && stream_) {
        allocator_->free(stream_);
    }
    allocator_.reset();
}

void LibcameraCapturer::RequestComplete(libcamera::Request *request) {
    if (request->status() == libcamera::Request::RequestCancelled) {
        return;
    }

    auto &buffers = request->buffers();
    auto *buffer = buffers.begin()->second;

    int fd = buffer->planes()[0].fd.get();
    timeval tv = {};
    tv.tv_sec = buffer->metadata().timestamp / 1000000000;
    tv.tv_usec = (buffer->metadata().timestamp % 1000000000) / 1000;

    V4l2Buffer v4l2_buffer(mapped_buffers_[fd].first, mapped_buffers_[fd].second, 0, tv);
    auto frame_buffer =
        FrameBuffer::FromRaw(v4l2_buffer, config_.width, config_.height, format(), stride_);

    {
        std::lock_guard<std::mutex> lock(mtx_);
        request->reuse(libcamera::Request::ReuseBuffers);
        for (const auto &[id, value] : controls_) {
            request->controls().set(id, value);
        }
        controls_.clear();
        if (capturing_.load()) {
            camera_->queueRequest(request);
        }
    }

    if (frame_buffer) {
        NextFrameBuffer(frame_buffer);
    }
}

void LibcameraCapturer::StartCapture() {
    if (capturing_.load()) {
        return;
    }

    if (camera_->configure(camera_config_.get()) < 0) {
        throw CaptureError("failed to configure " + config_.name);
    }

    AllocateBuffer();
    QueueFrameControls(config_.fps, config_.exposure, config_.gain);

    camera_->requestCompleted.connect(this, &LibcameraCapturer::RequestComplete);

    std::lock_guard<std::mutex> lock(mtx_);
    if (camera_->start(&controls_) < 0) {
        ReleaseBuffer();
        throw CaptureError("failed to start " + config_.name);
    }
    controls_.clear();
    capturing_.store(true);

    for (auto &request : requests_) {
        if (camera_->queueRequest(request.get()) < 0) {
            ERROR_PRINT("%s can't queue request", config_.name.c_str());
        }
    }
}

void LibcameraCapturer::StopCapture() {
    if (!capturing_.exchange(false)) {
        return;
    }

    camera_->stop();
    camera_->requestCompleted.disconnect(this, &LibcameraCapturer::RequestComplete);
    ReleaseBuffer();
}
