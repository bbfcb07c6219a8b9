#include "recorder/utils.h"

#include "common/logging.h"

AVFormatContext *RecUtil::CreateContainer(const std::string &folder, const std::string &filename) {
    AVFormatContext *fmt_ctx = nullptr;
    std::string container = "mp4";
    auto full_path = folder + '/' + filename + "." + container;

    int ret = avformat_alloc_output_context2(&fmt_ctx, nullptr, container.c_str(),
                                             full_path.c_str());
    if (ret < 0 || !fmt_ctx) {
        ERROR_PRINT("Could not alloc output context: %s", ErrorString(ret).c_str());
        return nullptr;
    }

    if (!(fmt_ctx->oformat->flags & AVFMT_NOFILE)) {
        if ((ret = avio_open(&fmt_ctx->pb, full_path.c_str(), AVIO_FLAG_WRITE)) < 0) {
            ERROR_PRINT("Could not open %s: %s", full_path.c_str(), ErrorString(ret).c_str());
            avformat_free_context(fmt_ctx);
            return nullptr;
        }
    }
    DEBUG_PRINT("Created container %s", full_path.c_str());

    return fmt_ctx;
}

bool RecUtil::WriteFormatHeader(AVFormatContext *fmt_ctx) {
    int ret = avformat_write_header(fmt_ctx, nullptr);
    if (ret < 0) {
        ERROR_PRINT("Error occurred when writing header: %s", ErrorString(ret).c_str());
        return false;
    }
    return true;
}

void RecUtil::CloseContext(AVFormatContext *fmt_ctx) {
    if (fmt_ctx) {
        av_write_trailer(fmt_ctx);
        avio_closep(&fmt_ctx->pb);
        avformat_free_context(fmt_ctx);
    }
}

void RecUtil::FreeContext(AVFormatContext *fmt_ctx) {
    if (fmt_ctx) {
        avio_closep(&fmt_ctx->pb);
        avformat_free_context(fmt_ctx);
    }
}

AVCodecContext *RecUtil::OpenVideoEncoder(const std::vector<std::string> &candidates, int width,
                                          int height, int fps, bool global_header) {
    AVRational frame_rate = {.num = fps, .den = 1};

    for (const auto &name : candidates) {
        const AVCodec *codec = avcodec_find_encoder_by_name(name.c_str());
        if (!codec) {
            DEBUG_PRINT("Encoder %s is not available", name.c_str());
            continue;
        }

        AVCodecContext *encoder = avcodec_alloc_context3(codec);
        if (!encoder) {
            continue;
        }
        encoder->codec_type = AVMEDIA_TYPE_VIDEO;
        encoder->width = width;
        encoder->height = height;
        encoder->pix_fmt = AV_PIX_FMT_YUV420P;
        encoder->framerate = frame_rate;
        encoder->time_base = av_inv_q(frame_rate);
        encoder->gop_size = fps;
        encoder->max_b_frames = 0;
        encoder->bit_rate = static_cast<int64_t>(width) * height * fps / 8;
        if (global_header) {
            encoder->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
        }

        int ret = avcodec_open2(encoder, codec, nullptr);
        if (ret < 0) {
            DEBUG_PRINT("Encoder %s failed to open: %s", name.c_str(), ErrorString(ret).c_str());
            avcodec_free_context(&encoder);
            continue;
        }

        INFO_PRINT("Using encoder %s (%dx%d@%d)", name.c_str(), width, height, fps);
        return encoder;
    }

    ERROR_PRINT("No usable video encoder for %dx%d@%d", width, height, fps);
    return nullptr;
}

std::string RecUtil::ErrorString(int errnum) {
    char err_buf[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(errnum, err_buf, sizeof(err_buf));
    return err_buf;
}
