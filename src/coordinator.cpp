#include "coordinator.h"

#include "capturer/fake_capturer.h"
#include "capturer/libcamera_capturer.h"
#include "capturer/v4l2_capturer.h"
#include "common/errors.h"
#include "common/logging.h"

namespace {

const int kFakeDisparityPx = 18;

ParameterSet InitialParameters(const Args &args) {
    ParameterSet params;
    params.width = args.width;
    params.height = args.height;
    params.fps = args.fps;
    params.record_fps = args.record_fps;
    params.exposure_us = args.exposure;
    params.gain = args.gain;
    params.baseline_mm = args.baseline_mm;
    params.show_right = args.show_right;
    params.show_disparity = args.show_disparity;
    return params;
}

RecorderConfig RecorderConfigFromArgs(const Args &args) {
    RecorderConfig config;
    config.record_path = args.record_path;
    config.min_free_mb = args.min_free_mb;
    config.queue_capacity = args.record_queue;
    config.jpeg_quality = args.jpeg_quality;
    return config;
}

StatusConfig StatusConfigFromArgs(const Args &args) {
    StatusConfig config;
    config.thermal_path = args.thermal_path;
    config.storage_path = args.record_path;
    config.battery_path = args.battery_path;
    config.battery_scale = args.battery_scale;
    config.interval_ms = args.stats_interval_ms;
    config.temp_warn_c = args.temp_warn_c;
    config.battery_warn_v = args.battery_warn_v;
    return config;
}

} // namespace

std::shared_ptr<Coordinator> Coordinator::Create(Args args) {
    auto ptr = std::make_shared<Coordinator>(args);
    ptr->InitializeObservers();
    return ptr;
}

Coordinator::Coordinator(Args args)
    : args_(args),
      previewing_(false),
      params_(std::make_unique<ParameterStore>(InitialParameters(args))),
      composer_(args.show_right, args.show_disparity, args.fps),
      record_gate_(args.record_fps),
      sessions_(SessionManager::Create(RecorderConfigFromArgs(args))) {
    if (!Utils::CreateFolder(args_.record_path)) {
        WARN_PRINT("Record path %s is not available", args_.record_path.c_str());
    }
    status_ = StatusAggregator::Create(StatusConfigFromArgs(args_), [this](StatusSnapshot &s) {
        FillRuntimeStatus(s);
    });
}

Coordinator::~Coordinator() { Shutdown(); }

Args Coordinator::config() const { return args_; }

void Coordinator::SetCapturerFactory(CapturerFactory factory) {
    std::lock_guard<std::mutex> lock(mtx_);
    capturer_factory_ = std::move(factory);
}

void Coordinator::InitializeObservers() {
    param_observer_ = params_->AsObservable();
    param_observer_->Subscribe([this](ParameterUpdate &update) {
        OnParameterUpdate(update);
    });

    session_observer_ = sessions_->AsObservable();
    session_observer_->Subscribe([this](RecordingSession &session) {
        OnSessionChanged(session);
    });

    status_->Start();
}

std::shared_ptr<VideoCapturer> Coordinator::CreateCapturer(const ParameterSet &params,
                                                           bool right) const {
    CaptureConfig config;
    config.name = right ? "right" : "left";
    config.width = params.width;
    config.height = params.height;
    config.fps = params.fps;
    config.format = args_.format;
    config.exposure = params.exposure_us;
    config.gain = params.gain;

    if (capturer_factory_) {
        config.shift_px = right ? kFakeDisparityPx : 0;
        return capturer_factory_(config);
    } else if (args_.source == "v4l2") {
        config.device = right ? args_.right_device : args_.left_device;
        return V4l2Capturer::Create(config);
    } else if (args_.source == "libcamera") {
        config.camera_index = right ? args_.right_camera : args_.left_camera;
        return LibcameraCapturer::Create(config);
    }
    config.shift_px = right ? kFakeDisparityPx : 0;
    return FakeCapturer::Create(config);
}

void Coordinator::StartPreview() {
    std::lock_guard<std::mutex> lock(mtx_);
    StartPreviewLocked();
}

void Coordinator::StartPreviewLocked() {
    if (previewing_.load()) {
        return;
    }

    auto params = params_->Get();
    auto left = CreateCapturer(params, false);
    auto right = CreateCapturer(params, true);
    stereo_ = StereoSource::Create(left, right, args_.pair_tolerance_us);

    composer_.Clear();
    composer_.SetView(params.show_right, params.show_disparity);
    composer_.SetTargetFps(params.fps);
    preview_fps_.Reset();
    capture_fps_.Reset();

    pair_observer_ = stereo_->AsObservable();
    pair_observer_->Subscribe([this](FramePair &pair) {
        OnFramePair(pair);
    });

    try {
        stereo_->StartCapture();
    } catch (const CaptureError &) {
        pair_observer_.reset();
        stereo_.reset();
        throw;
    }
    previewing_.store(true);
    INFO_PRINT("Preview started (%s, %dx%d@%d)", args_.source.c_str(), params.width,
               params.height, params.fps);
}

void Coordinator::StopPreview() {
    std::lock_guard<std::mutex> lock(mtx_);
    StopRecordingLocked();
    StopPreviewLocked();
}

void Coordinator::StopPreviewLocked() {
    if (!stereo_) {
        return;
    }
    previewing_.store(false);
    stereo_->StopCapture();
    pair_observer_.reset();
    stereo_->UnSubscribe();
    INFO_PRINT("Preview stopped after %llu pairs (dropped left %llu, right %llu)",
               static_cast<unsigned long long>(stereo_->pairs()),
               static_cast<unsigned long long>(stereo_->dropped_left()),
               static_cast<unsigned long long>(stereo_->dropped_right()));
    stereo_.reset();
}

bool Coordinator::IsPreviewing() const { return previewing_.load(); }

RecordingSession Coordinator::StartRecording(const std::string &out_dir) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!previewing_.load()) {
        throw RecordingError("preview is not running");
    }

    auto params = params_->Get();
    int width = params.width * composer_.PanelCount();
    record_gate_.SetFps(params.record_fps);
    record_gate_.Reset();
    return sessions_->Start(out_dir, width, params.height, params.record_fps);
}

std::optional<RecordingSession> Coordinator::StopRecording() {
    std::lock_guard<std::mutex> lock(mtx_);
    return StopRecordingLocked();
}

std::optional<RecordingSession> Coordinator::StopRecordingLocked() { return sessions_->Stop(); }

std::optional<RecordingSession> Coordinator::Recording() const { return sessions_->session(); }

ParameterSet Coordinator::Parameters() const { return params_->Get(); }

ParameterSet Coordinator::UpdateParameters(const ParameterPatch &patch) {
    std::lock_guard<std::mutex> lock(mtx_);
    params_->Update(patch);
    return params_->Get();
}

void Coordinator::OnParameterUpdate(ParameterUpdate &update) {
    bool was_previewing = previewing_.load();
    try {
        ApplyParameters(update.params, update.change);
    } catch (const CaptureError &e) {
        ERROR_PRINT("Cannot apply parameters: %s", e.what());
        RollbackParameters(update.previous, was_previewing);
        throw;
    }
}

void Coordinator::ApplyParameters(const ParameterSet &params, const ParameterChange &change) {
    if (change.view) {
        composer_.SetView(params.show_right, params.show_disparity);
    }
    if (change.record_fps) {
        record_gate_.SetFps(params.record_fps);
    }
    if (change.baseline) {
        INFO_PRINT("Stereo baseline set to %.1f mm", params.baseline_mm);
    }
    if (!previewing_.load()) {
        composer_.SetTargetFps(params.fps);
        return;
    }

    if (change.resolution) {
        INFO_PRINT("Restarting preview for %dx%d", params.width, params.height);
        StopPreviewLocked();
        StartPreviewLocked();
        return;
    }
    if (change.fps) {
        composer_.SetTargetFps(params.fps);
        for (auto capturer : {stereo_->left(), stereo_->right()}) {
            if (!capturer->SetFps(params.fps)) {
                WARN_PRINT("%s camera rejected %d fps", capturer->name().c_str(), params.fps);
            }
        }
    }
    if (change.exposure) {
        for (auto capturer : {stereo_->left(), stereo_->right()}) {
            if (!capturer->SetExposure(params.exposure_us, params.gain)) {
                WARN_PRINT("%s camera rejected exposure %dus gain %.2f",
                           capturer->name().c_str(), params.exposure_us, params.gain);
            }
        }
    }
}

void Coordinator::RollbackParameters(const ParameterSet &previous, bool was_previewing) {
    params_->Restore(previous);
    composer_.SetView(previous.show_right, previous.show_disparity);
    composer_.SetTargetFps(previous.fps);
    record_gate_.SetFps(previous.record_fps);
    if (!was_previewing) {
        return;
    }

    StopPreviewLocked();
    try {
        StartPreviewLocked();
    } catch (const CaptureError &e) {
        ERROR_PRINT("Preview could not be restarted with %dx%d@%d: %s", previous.width,
                    previous.height, previous.fps, e.what());
    }
}

void Coordinator::OnSessionChanged(RecordingSession &session) {
    params_->LockResolution(session.status == SessionStatus::RECORDING);
    if (session.status == SessionStatus::FAILED && session.error) {
        ERROR_PRINT("Recording %s failed: %s", session.id.c_str(), session.error->c_str());
    }
}

void Coordinator::OnFramePair(FramePair &pair) {
    capture_fps_.Tick(pair.timestamp_us);

    auto composite = composer_.Offer(pair);
    if (composite) {
        preview_fps_.Tick(pair.timestamp_us);
    }

    if (sessions_->IsRecording() && record_gate_.Admit(pair.timestamp_us)) {
        if (!composite) {
            composite = composer_.ComposeCurrent(pair);
        }
        sessions_->OnFrame(composite);
    }
}

std::string Coordinator::Snapshot() {
    auto frame = composer_.latest();
    if (!frame) {
        throw RecordingError("no preview frame available");
    }

    auto folder = args_.record_path + "snapshots";
    if (!Utils::CreateFolder(folder)) {
        throw RecordingError("cannot create " + folder);
    }
    auto name = folder + "/" + Utils::GenerateFilename().filename;
    auto path = name + ".jpg";
    if (fs::exists(path)) {
        path = name + "_" + Utils::GenerateUuid().substr(0, 8) + ".jpg";
    }
    if (!Utils::CreateJpegImage(*frame, path, args_.jpeg_quality)) {
        throw RecordingError("cannot write " + path);
    }
    INFO_PRINT("Snapshot saved to %s", path.c_str());
    return path;
}

std::shared_ptr<FrameBuffer> Coordinator::LatestPreviewFrame() const { return composer_.latest(); }

std::optional<Buffer> Coordinator::LatestPreviewJpeg() const {
    auto frame = composer_.latest();
    if (!frame) {
        return std::nullopt;
    }
    return Utils::ConvertYuvToJpeg(*frame, args_.jpeg_quality);
}

void Coordinator::FillRuntimeStatus(StatusSnapshot &snapshot) {
    if (previewing_.load()) {
        snapshot.preview_fps = preview_fps_.fps();
        snapshot.capture_fps = capture_fps_.fps();
    }
    snapshot.recording = sessions_->IsRecording();
}

StatusSnapshot Coordinator::Status() {
    auto latest = status_->latest();
    if (!latest) {
        return status_->Poll();
    }
    // sensors follow the polling cadence, runtime fields are always current
    latest->preview_fps.reset();
    latest->capture_fps.reset();
    FillRuntimeStatus(*latest);
    return *latest;
}

std::shared_ptr<StereoSource> Coordinator::stereo_source() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return stereo_;
}

void Coordinator::Shutdown() {
    std::lock_guard<std::mutex> lock(mtx_);
    StopRecordingLocked();
    StopPreviewLocked();
    if (status_) {
        status_->Stop();
    }
}
