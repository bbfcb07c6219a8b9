#include "recorder/session_manager.h"

#include <chrono>

#include "common/logging.h"
#include "common/utils.h"
#include "recorder/utils.h"

std::unique_ptr<SessionManager> SessionManager::Create(RecorderConfig config) {
    return std::make_unique<SessionManager>(std::move(config));
}

SessionManager::SessionManager(RecorderConfig config)
    : config_(std::move(config)),
      accepting_(false),
      queue_(config_.queue_capacity),
      fmt_ctx_(nullptr),
      thumbnail_written_(false),
      next_space_check_us_(0) {}

SessionManager::~SessionManager() { Stop(); }

const RecorderConfig &SessionManager::config() const { return config_; }

void SessionManager::SetSpaceProbe(SpaceProbe probe) {
    std::lock_guard<std::mutex> lock(mtx_);
    space_probe_ = std::move(probe);
}

bool SessionManager::HasFreeSpace(const std::string &path) {
    SpaceProbe probe;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        probe = space_probe_;
    }
    if (!probe) {
        return Utils::CheckDriveSpace(path, config_.min_free_mb);
    }
    auto free_bytes = probe(path);
    if (!free_bytes) {
        return false;
    }
    return *free_bytes / (1024 * 1024) >= config_.min_free_mb;
}

RecordingError SessionManager::FailStart(const std::string &reason) {
    ERROR_PRINT("Cannot start recording: %s", reason.c_str());
    return RecordingError(reason);
}

RecordingSession SessionManager::Start(const std::string &out_dir, int width, int height,
                                       int fps) {
    std::lock_guard<std::mutex> control_lock(control_mtx_);

    if (accepting_.load()) {
        throw FailStart("a recording is already active");
    }
    if (width <= 0 || height <= 0 || fps <= 0) {
        throw FailStart("invalid frame size " + std::to_string(width) + "x" +
                        std::to_string(height) + "@" + std::to_string(fps));
    }
    // a session that failed on its own leaves its idle writer behind
    writer_.reset();

    std::string base = out_dir.empty() ? config_.record_path : out_dir;
    while (base.size() > 1 && base.back() == '/') {
        base.pop_back();
    }
    if (!Utils::CreateFolder(base)) {
        throw FailStart("cannot create output directory " + base);
    }
    if (!HasFreeSpace(base)) {
        throw FailStart("free space is below " + std::to_string(config_.min_free_mb) + " MB");
    }

    auto id = Utils::GenerateUuid();
    auto file_info = Utils::GenerateFilename();
    auto folder = base + "/" + file_info.date + "/" + file_info.filename + "_" + id.substr(0, 8);
    if (!Utils::CreateFolder(folder)) {
        throw FailStart("cannot create output directory " + folder);
    }

    RecordingSession session;
    session.id = id;
    session.start_time = Utils::UnixTimeNow();
    session.output_path = folder;
    session.width = width;
    session.height = height;
    session.fps = fps;

    fmt_ctx_ = RecUtil::CreateContainer(folder, "recording");
    if (fmt_ctx_) {
        video_recorder_ = VideoRecorder::Create(fmt_ctx_, width, height, fps, config_.encoders);
    }
    if (!fmt_ctx_ || !video_recorder_ || !RecUtil::WriteFormatHeader(fmt_ctx_) ||
        !timestamp_log_.Open(folder + "/timestamps.csv")) {
        std::string reason = !fmt_ctx_          ? "cannot create container"
                             : !video_recorder_ ? "no usable video encoder"
                                                : "cannot write output files";
        video_recorder_.reset();
        RecUtil::FreeContext(fmt_ctx_);
        fmt_ctx_ = nullptr;
        timestamp_log_.Close();

        session.status = SessionStatus::FAILED;
        session.stop_time = Utils::UnixTimeNow();
        session.error = reason;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            session_ = session;
        }
        Publish();
        throw FailStart(reason);
    }

    session.encoder = video_recorder_->encoder_name();
    session.status = SessionStatus::RECORDING;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        session_ = session;
    }

    thumbnail_written_ = false;
    next_space_check_us_ = Utils::MonotonicTimeUs() + config_.space_check_interval_ms * 1000LL;
    queue_.clear();
    accepting_.store(true);

    writer_ = std::make_unique<Worker>("Recorder", [this]() {
        WriterLoop();
    });
    writer_->Run();

    INFO_PRINT("Recording %s started: %s (%dx%d@%d, %s)", id.c_str(), folder.c_str(), width,
               height, fps, session.encoder.c_str());
    Publish();
    return session;
}

std::optional<RecordingSession> SessionManager::Stop() {
    std::lock_guard<std::mutex> control_lock(control_mtx_);

    if (writer_) {
        accepting_.store(false);
        writer_.reset();

        while (auto item = queue_.pop_for(std::chrono::milliseconds(0))) {
            WriteFrame(*item);
        }
        if (fmt_ctx_) {
            Finalize(SessionStatus::STOPPED);
        }
    }

    std::lock_guard<std::mutex> lock(mtx_);
    return session_;
}

bool SessionManager::OnFrame(std::shared_ptr<FrameBuffer> frame) {
    if (!frame || !accepting_.load()) {
        return false;
    }
    if (queue_.try_push({frame, Utils::UnixTimeNow()})) {
        return true;
    }

    uint64_t dropped;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!session_) {
            return false;
        }
        dropped = ++session_->frames_dropped;
    }
    if (dropped == 1 || dropped % 100 == 0) {
        WARN_PRINT("Recorder queue is full, %llu frames dropped",
                   static_cast<unsigned long long>(dropped));
    }
    return false;
}

bool SessionManager::IsRecording() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return session_ && session_->status == SessionStatus::RECORDING;
}

std::optional<RecordingSession> SessionManager::session() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return session_;
}

void SessionManager::WriterLoop() {
    auto item = queue_.pop_for(std::chrono::milliseconds(50));
    if (item) {
        WriteFrame(*item);
    }

    if (fmt_ctx_ && Utils::MonotonicTimeUs() >= next_space_check_us_) {
        next_space_check_us_ = Utils::MonotonicTimeUs() + config_.space_check_interval_ms * 1000LL;
        std::string folder;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            folder = session_->output_path;
        }
        if (!HasFreeSpace(folder)) {
            ERROR_PRINT("Free space dropped below %lu MB, stopping recording",
                        config_.min_free_mb);
            Finalize(SessionStatus::FAILED, "storage full");
        }
    }
}

void SessionManager::WriteFrame(const QueuedFrame &item) {
    if (!fmt_ctx_ || !video_recorder_) {
        return;
    }

    uint64_t frame_idx;
    std::string folder;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        frame_idx = session_->frames_written;
        folder = session_->output_path;
    }

    if (!thumbnail_written_) {
        thumbnail_written_ = Utils::CreateJpegImage(*item.frame, folder + "/recording.jpg",
                                                    config_.jpeg_quality);
    }

    if (!video_recorder_->Encode(*item.frame, frame_idx)) {
        Finalize(SessionStatus::FAILED, "encoder error");
        return;
    }
    if (!timestamp_log_.Append(frame_idx, item.unix_time)) {
        ERROR_PRINT("Cannot append frame %llu to timestamps.csv",
                    static_cast<unsigned long long>(frame_idx));
        Finalize(SessionStatus::FAILED, "cannot write timestamps");
        return;
    }

    std::lock_guard<std::mutex> lock(mtx_);
    session_->frames_written++;
}

void SessionManager::Finalize(SessionStatus status, const std::string &error) {
    accepting_.store(false);

    if (video_recorder_ && !video_recorder_->Flush()) {
        ERROR_PRINT("Encoder flush failed, the file may be truncated");
    }
    video_recorder_.reset();
    RecUtil::CloseContext(fmt_ctx_);
    fmt_ctx_ = nullptr;
    timestamp_log_.Close();
    queue_.clear();

    {
        std::lock_guard<std::mutex> lock(mtx_);
        session_->status = status;
        session_->stop_time = Utils::UnixTimeNow();
        if (!error.empty()) {
            session_->error = error;
        }
        INFO_PRINT("Recording %s %s: %llu frames written, %llu dropped", session_->id.c_str(),
                   ToString(status), static_cast<unsigned long long>(session_->frames_written),
                   static_cast<unsigned long long>(session_->frames_dropped));
    }
    Publish();
}

void SessionManager::Publish() {
    RecordingSession snapshot;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!session_) {
            return;
        }
        snapshot = *session_;
    }
    Next(snapshot);
}
