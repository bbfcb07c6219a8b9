#ifndef STEREO_SOURCE_H_
#define STEREO_SOURCE_H_

#include <deque>
#include <mutex>

#include "capturer/frame_pair.h"
#include "capturer/video_capturer.h"
#include "common/interface/subject.h"

/*
 * Joins the frames of two free running cameras into FramePairs.
 *
 * A left frame is matched with the newest right frame whose timestamp is within
 * `tolerance_us` of it. Frames that can no longer be matched are dropped and
 * counted. Pairs are published on the thread that completed them, while the
 * pairing lock is held, so observers must not call back into the source.
 */
class StereoSource : public Subject<FramePair> {
  public:
    static std::shared_ptr<StereoSource> Create(std::shared_ptr<VideoCapturer> left,
                                                std::shared_ptr<VideoCapturer> right,
                                                int tolerance_us = 0);

    StereoSource(std::shared_ptr<VideoCapturer> left, std::shared_ptr<VideoCapturer> right,
                 int tolerance_us);
    ~StereoSource();

    void StartCapture();
    void StopCapture();
    bool is_capturing() const;

    void PushLeft(std::shared_ptr<FrameBuffer> frame);
    void PushRight(std::shared_ptr<FrameBuffer> frame);

    // 0 selects half of the current frame period.
    void SetTolerance(int tolerance_us);
    int tolerance_us() const;

    uint64_t pairs() const;
    uint64_t dropped_left() const;
    uint64_t dropped_right() const;

    std::shared_ptr<VideoCapturer> left() const;
    std::shared_ptr<VideoCapturer> right() const;

  private:
    static const size_t kMaxPending = 4;

    mutable std::mutex mtx_;
    int tolerance_us_;
    uint64_t sequence_;
    uint64_t dropped_left_;
    uint64_t dropped_right_;
    std::deque<std::shared_ptr<FrameBuffer>> pending_left_;
    std::deque<std::shared_ptr<FrameBuffer>> pending_right_;

    std::shared_ptr<VideoCapturer> left_;
    std::shared_ptr<VideoCapturer> right_;
    std::shared_ptr<Observable<VideoCapturer::FrameBufferPtr>> left_observer_;
    std::shared_ptr<Observable<VideoCapturer::FrameBufferPtr>> right_observer_;

    int EffectiveTolerance() const;
    void Match();
    std::shared_ptr<FrameBuffer> FitToLeft(const std::shared_ptr<FrameBuffer> &left,
                                           const std::shared_ptr<FrameBuffer> &right) const;
};

#endif // STEREO_SOURCE_H_
