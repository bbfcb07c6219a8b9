#ifndef SESSION_MANAGER_H_
#define SESSION_MANAGER_H_

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "common/errors.h"
#include "common/frame_buffer.h"
#include "common/interface/subject.h"
#include "common/thread_safe_queue.h"
#include "common/worker.h"
#include "recorder/recording_session.h"
#include "recorder/timestamp_log.h"
#include "recorder/video_recorder.h"

struct RecorderConfig {
    std::string record_path = "/var/lib/stereo-rig/";
    unsigned long min_free_mb = 400;
    size_t queue_capacity = 8;
    int space_check_interval_ms = 5000;
    int jpeg_quality = 80;
    std::vector<std::string> encoders = {"h264_v4l2m2m", "libx264", "mpeg4"};
};

/*
 * Owns the recording lifecycle. Frames are handed over through a bounded
 * queue (newest frame dropped when full) and written by a dedicated thread
 * into `<base>/<YYYYMMDD>/<YYYYMMDD_HHMMSS>_<id8>/recording.mp4` with a
 * matching timestamps.csv and a recording.jpg thumbnail. Observers get the
 * session every time its status changes.
 */
class SessionManager : public Subject<RecordingSession> {
  public:
    using SpaceProbe = std::function<std::optional<uint64_t>(const std::string &)>;

    static std::unique_ptr<SessionManager> Create(RecorderConfig config);

    explicit SessionManager(RecorderConfig config);
    ~SessionManager();

    // Throws RecordingError if a session is active, the directory cannot be
    // created, space is short or no encoder opens.
    RecordingSession Start(const std::string &out_dir, int width, int height, int fps);
    // Drains queued frames and finalizes the files. Without an active session
    // it returns the last session, if any.
    std::optional<RecordingSession> Stop();

    // Returns false when the frame was not queued (idle, or queue full).
    bool OnFrame(std::shared_ptr<FrameBuffer> frame);

    bool IsRecording() const;
    std::optional<RecordingSession> session() const;
    const RecorderConfig &config() const;

    void SetSpaceProbe(SpaceProbe probe);

  private:
    struct QueuedFrame {
        std::shared_ptr<FrameBuffer> frame;
        double unix_time;
    };

    RecorderConfig config_;
    std::mutex control_mtx_;
    mutable std::mutex mtx_;
    std::optional<RecordingSession> session_;
    std::atomic<bool> accepting_;
    SpaceProbe space_probe_;

    ThreadSafeQueue<QueuedFrame> queue_;
    std::unique_ptr<Worker> writer_;

    // owned by the writer thread while it runs
    AVFormatContext *fmt_ctx_;
    std::unique_ptr<VideoRecorder> video_recorder_;
    TimestampLog timestamp_log_;
    bool thumbnail_written_;
    int64_t next_space_check_us_;

    bool HasFreeSpace(const std::string &path);
    void WriterLoop();
    void WriteFrame(const QueuedFrame &item);
    void Finalize(SessionStatus status, const std::string &error = "");
    void Publish();
    RecordingError FailStart(const std::string &reason);
};

#endif // SESSION_MANAGER_H_
