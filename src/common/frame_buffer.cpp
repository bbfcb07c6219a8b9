#include "common/frame_buffer.h"

#include <cstring>

#include <libyuv.h>

#include "common/logging.h"

std::shared_ptr<FrameBuffer> FrameBuffer::Create(int width, int height) {
    return std::make_shared<FrameBuffer>(width, height);
}

std::shared_ptr<FrameBuffer> FrameBuffer::FromRaw(const V4l2Buffer &buffer, int width,
                                                  int height, uint32_t format, int stride) {
    auto frame = FrameBuffer::Create(width, height);
    frame->SetTimestamp(buffer.timestamp.tv_sec * 1000000LL + buffer.timestamp.tv_usec);

    const uint8_t *src = static_cast<const uint8_t *>(buffer.start);
    int ret = -1;

    if (format == V4L2_PIX_FMT_MJPEG) {
        ret = libyuv::ConvertToI420(src, buffer.length, frame->MutableDataY(), frame->StrideY(),
                                    frame->MutableDataU(), frame->StrideU(),
                                    frame->MutableDataV(), frame->StrideV(), 0, 0, width, height,
                                    width, height, libyuv::kRotate0, libyuv::FOURCC_MJPG);
    } else if (format == V4L2_PIX_FMT_YUYV) {
        int src_stride = stride > 0 ? stride : width * 2;
        ret = libyuv::YUY2ToI420(src, src_stride, frame->MutableDataY(), frame->StrideY(),
                                 frame->MutableDataU(), frame->StrideU(), frame->MutableDataV(),
                                 frame->StrideV(), width, height);
    } else if (format == V4L2_PIX_FMT_YUV420) {
        int src_stride_y = stride > 0 ? stride : width;
        int src_stride_uv = (src_stride_y + 1) / 2;
        const uint8_t *src_u = src + src_stride_y * height;
        const uint8_t *src_v = src_u + src_stride_uv * ((height + 1) / 2);
        if (buffer.length < static_cast<unsigned int>(src_v - src) +
                                src_stride_uv * ((height + 1) / 2)) {
            ERROR_PRINT("I420 buffer too small: %u bytes for %dx%d", buffer.length, width, height);
            return nullptr;
        }
        ret = libyuv::I420Copy(src, src_stride_y, src_u, src_stride_uv, src_v, src_stride_uv,
                               frame->MutableDataY(), frame->StrideY(), frame->MutableDataU(),
                               frame->StrideU(), frame->MutableDataV(), frame->StrideV(), width,
                               height);
    } else {
        ERROR_PRINT("Unsupported capture format: %s", V4l2Util::FourccToString(format).c_str());
        return nullptr;
    }

    if (ret < 0) {
        ERROR_PRINT("%s ConvertToI420 failed", V4l2Util::FourccToString(format).c_str());
        return nullptr;
    }
    return frame;
}

FrameBuffer::FrameBuffer(int width, int height)
    : width_(width),
      height_(height),
      timestamp_us_(0),
      data_(static_cast<size_t>(width) * height +
            2 * static_cast<size_t>((width + 1) / 2) * ((height + 1) / 2)) {}

int FrameBuffer::width() const { return width_; }

int FrameBuffer::height() const { return height_; }

int FrameBuffer::StrideY() const { return width_; }

int FrameBuffer::StrideU() const { return (width_ + 1) / 2; }

int FrameBuffer::StrideV() const { return (width_ + 1) / 2; }

int FrameBuffer::ChromaHeight() const { return (height_ + 1) / 2; }

size_t FrameBuffer::size() const { return data_.size(); }

const uint8_t *FrameBuffer::DataY() const { return data_.data(); }

const uint8_t *FrameBuffer::DataU() const { return DataY() + StrideY() * height_; }

const uint8_t *FrameBuffer::DataV() const { return DataU() + StrideU() * ChromaHeight(); }

uint8_t *FrameBuffer::MutableDataY() { return data_.data(); }

uint8_t *FrameBuffer::MutableDataU() { return MutableDataY() + StrideY() * height_; }

uint8_t *FrameBuffer::MutableDataV() { return MutableDataU() + StrideU() * ChromaHeight(); }

int64_t FrameBuffer::timestamp_us() const { return timestamp_us_; }

void FrameBuffer::SetTimestamp(int64_t timestamp_us) { timestamp_us_ = timestamp_us; }

void FrameBuffer::Fill(uint8_t y, uint8_t u, uint8_t v) {
    memset(MutableDataY(), y, StrideY() * height_);
    memset(MutableDataU(), u, StrideU() * ChromaHeight());
    memset(MutableDataV(), v, StrideV() * ChromaHeight());
}
