#ifndef COORDINATOR_H_
#define COORDINATOR_H_

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "args.h"
#include "capturer/stereo_source.h"
#include "capturer/video_capturer.h"
#include "common/utils.h"
#include "params/parameter_store.h"
#include "preview/fps_meter.h"
#include "preview/frame_gate.h"
#include "preview/preview_composer.h"
#include "recorder/session_manager.h"
#include "status/status_aggregator.h"

/*
 * Single entry point for the control service. Owns the cameras, the stereo
 * pairing, the preview, the recorder and the status poller. Public methods
 * are thread safe; operator errors surface as ParameterError, RecordingError
 * or CaptureError.
 */
class Coordinator {
  public:
    using CapturerFactory =
        std::function<std::shared_ptr<VideoCapturer>(const CaptureConfig &config)>;

    // Throws ParameterError if the configured capture settings are invalid.
    static std::shared_ptr<Coordinator> Create(Args args);

    Coordinator(Args args);
    ~Coordinator();

    Args config() const;
    // Replaces the backend selected by `source` for cameras opened from now on.
    void SetCapturerFactory(CapturerFactory factory);

    void StartPreview();
    void StopPreview();
    bool IsPreviewing() const;

    RecordingSession StartRecording(const std::string &out_dir = "");
    std::optional<RecordingSession> StopRecording();
    std::optional<RecordingSession> Recording() const;

    ParameterSet Parameters() const;
    ParameterSet UpdateParameters(const ParameterPatch &patch);

    // Saves the current composite into <record_path>/snapshots and returns its path.
    std::string Snapshot();
    std::optional<Buffer> LatestPreviewJpeg() const;
    std::shared_ptr<FrameBuffer> LatestPreviewFrame() const;

    StatusSnapshot Status();
    std::shared_ptr<StereoSource> stereo_source() const;

    // Stops recording, preview and status polling, in that order.
    void Shutdown();

  private:
    Args args_;
    mutable std::mutex mtx_;
    std::atomic<bool> previewing_;

    std::unique_ptr<ParameterStore> params_;
    std::shared_ptr<StereoSource> stereo_;
    PreviewComposer composer_;
    FrameGate record_gate_;
    FpsMeter preview_fps_;
    FpsMeter capture_fps_;
    std::unique_ptr<SessionManager> sessions_;
    std::unique_ptr<StatusAggregator> status_;
    CapturerFactory capturer_factory_;

    std::shared_ptr<Observable<ParameterUpdate>> param_observer_;
    std::shared_ptr<Observable<FramePair>> pair_observer_;
    std::shared_ptr<Observable<RecordingSession>> session_observer_;

    void InitializeObservers();
    std::shared_ptr<VideoCapturer> CreateCapturer(const ParameterSet &params, bool right) const;
    void StartPreviewLocked();
    void StopPreviewLocked();
    std::optional<RecordingSession> StopRecordingLocked();

    void OnFramePair(FramePair &pair);
    // Runs on the thread that called UpdateParameters, with mtx_ held.
    void OnParameterUpdate(ParameterUpdate &update);
    void ApplyParameters(const ParameterSet &params, const ParameterChange &change);
    void RollbackParameters(const ParameterSet &previous, bool was_previewing);
    void OnSessionChanged(RecordingSession &session);
    void FillRuntimeStatus(StatusSnapshot &snapshot);
};

#endif // COORDINATOR_H_
