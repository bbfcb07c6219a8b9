#include "recorder/video_recorder.h"

#include <libyuv.h>

#include "common/logging.h"
#include "recorder/utils.h"

std::unique_ptr<VideoRecorder> VideoRecorder::Create(AVFormatContext *fmt_ctx, int width,
                                                     int height, int fps,
                                                     const std::vector<std::string> &encoders) {
    bool global_header = fmt_ctx->oformat->flags & AVFMT_GLOBALHEADER;
    AVCodecContext *encoder = RecUtil::OpenVideoEncoder(encoders, width, height, fps, global_header);
    if (!encoder) {
        return nullptr;
    }

    AVStream *st = avformat_new_stream(fmt_ctx, nullptr);
    if (!st || avcodec_parameters_from_context(st->codecpar, encoder) < 0) {
        ERROR_PRINT("Could not add video stream");
        avcodec_free_context(&encoder);
        return nullptr;
    }
    st->time_base = encoder->time_base;
    st->avg_frame_rate = encoder->framerate;

    return std::make_unique<VideoRecorder>(fmt_ctx, encoder, st);
}

VideoRecorder::VideoRecorder(AVFormatContext *fmt_ctx, AVCodecContext *encoder, AVStream *st)
    : fmt_ctx_(fmt_ctx),
      encoder_(encoder),
      st_(st),
      frame_(av_frame_alloc()),
      pkt_(av_packet_alloc()),
      sws_ctx_(nullptr) {
    frame_->format = encoder_->pix_fmt;
    frame_->width = encoder_->width;
    frame_->height = encoder_->height;
    if (av_frame_get_buffer(frame_, 0) < 0) {
        ERROR_PRINT("Could not allocate encoder frame");
    }
}

VideoRecorder::~VideoRecorder() {
    sws_freeContext(sws_ctx_);
    av_packet_free(&pkt_);
    av_frame_free(&frame_);
    avcodec_free_context(&encoder_);
}

std::string VideoRecorder::encoder_name() const { return encoder_->codec->name; }

int VideoRecorder::width() const { return encoder_->width; }

int VideoRecorder::height() const { return encoder_->height; }

bool VideoRecorder::FillFrame(const FrameBuffer &buffer) {
    if (av_frame_make_writable(frame_) < 0) {
        return false;
    }

    if (buffer.width() == encoder_->width && buffer.height() == encoder_->height) {
        return libyuv::I420Copy(buffer.DataY(), buffer.StrideY(), buffer.DataU(),
                                buffer.StrideU(), buffer.DataV(), buffer.StrideV(),
                                frame_->data[0], frame_->linesize[0], frame_->data[1],
                                frame_->linesize[1], frame_->data[2], frame_->linesize[2],
                                buffer.width(), buffer.height()) == 0;
    }

    sws_ctx_ = sws_getCachedContext(sws_ctx_, buffer.width(), buffer.height(), AV_PIX_FMT_YUV420P,
                                    encoder_->width, encoder_->height, encoder_->pix_fmt,
                                    SWS_BILINEAR, nullptr, nullptr, nullptr);
    if (!sws_ctx_) {
        ERROR_PRINT("Could not create scaler %dx%d -> %dx%d", buffer.width(), buffer.height(),
                    encoder_->width, encoder_->height);
        return false;
    }

    const uint8_t *src[] = {buffer.DataY(), buffer.DataU(), buffer.DataV()};
    const int src_stride[] = {buffer.StrideY(), buffer.StrideU(), buffer.StrideV()};
    sws_scale(sws_ctx_, src, src_stride, 0, buffer.height(), frame_->data, frame_->linesize);
    return true;
}

bool VideoRecorder::Encode(const FrameBuffer &buffer, int64_t pts) {
    if (!FillFrame(buffer)) {
        return false;
    }
    frame_->pts = pts;

    int ret = avcodec_send_frame(encoder_, frame_);
    if (ret < 0) {
        ERROR_PRINT("Error sending frame to encoder: %s", RecUtil::ErrorString(ret).c_str());
        return false;
    }
    return DrainPackets();
}

bool VideoRecorder::Flush() {
    int ret = avcodec_send_frame(encoder_, nullptr);
    if (ret < 0 && ret != AVERROR_EOF) {
        ERROR_PRINT("Error flushing encoder: %s", RecUtil::ErrorString(ret).c_str());
        return false;
    }
    return DrainPackets();
}

bool VideoRecorder::DrainPackets() {
    while (true) {
        int ret = avcodec_receive_packet(encoder_, pkt_);
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
            return true;
        } else if (ret < 0) {
            ERROR_PRINT("Error receiving packet: %s", RecUtil::ErrorString(ret).c_str());
            return false;
        }

        av_packet_rescale_ts(pkt_, encoder_->time_base, st_->time_base);
        pkt_->stream_index = st_->index;
        ret = av_interleaved_write_frame(fmt_ctx_, pkt_);
        av_packet_unref(pkt_);
        if (ret < 0) {
            ERROR_PRINT("Error writing packet: %s", RecUtil::ErrorString(ret).c_str());
            return false;
        }
    }
}
