#ifndef VIDEO_RECORDER_H_
#define VIDEO_RECORDER_H_

#include <memory>
#include <string>
#include <vector>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libswscale/swscale.h>
}

#include "common/frame_buffer.h"

/*
 * Encodes I420 frames into one video stream of an open container. Frames
 * whose size differs from the stream (e.g. the preview layout changed while
 * recording) are rescaled with swscale.
 */
class VideoRecorder {
  public:
    static std::unique_ptr<VideoRecorder> Create(AVFormatContext *fmt_ctx, int width, int height,
                                                 int fps,
                                                 const std::vector<std::string> &encoders);

    VideoRecorder(AVFormatContext *fmt_ctx, AVCodecContext *encoder, AVStream *st);
    ~VideoRecorder();

    bool Encode(const FrameBuffer &frame, int64_t pts);
    bool Flush();

    std::string encoder_name() const;
    int width() const;
    int height() const;

  private:
    AVFormatContext *fmt_ctx_;
    AVCodecContext *encoder_;
    AVStream *st_;
    AVFrame *frame_;
    AVPacket *pkt_;
    SwsContext *sws_ctx_;

    bool FillFrame(const FrameBuffer &buffer);
    bool DrainPackets();
};

#endif // VIDEO_RECORDER_H_
