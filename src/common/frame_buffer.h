#ifndef FRAME_BUFFER_H_
#define FRAME_BUFFER_H_

#include <cstdint>
#include <memory>
#include <vector>

#include "common/v4l2_utils.h"

/*
 * Tightly packed I420 image owned by the capture pipeline. Y stride equals the
 * width, U/V strides are half of it, rounded up.
 */
class FrameBuffer {
  public:
    static std::shared_ptr<FrameBuffer> Create(int width, int height);
    // Converts a captured MJPEG, YUYV or YUV420 buffer into I420. Returns
    // nullptr when the format is unsupported or the conversion fails.
    static std::shared_ptr<FrameBuffer> FromRaw(const V4l2Buffer &buffer, int width, int height,
                                                uint32_t format, int stride = 0);

    FrameBuffer(int width, int height);

    int width() const;
    int height() const;
    int StrideY() const;
    int StrideU() const;
    int StrideV() const;
    int ChromaHeight() const;
    size_t size() const;

    const uint8_t *DataY() const;
    const uint8_t *DataU() const;
    const uint8_t *DataV() const;
    uint8_t *MutableDataY();
    uint8_t *MutableDataU();
    uint8_t *MutableDataV();

    int64_t timestamp_us() const;
    void SetTimestamp(int64_t timestamp_us);

    void Fill(uint8_t y, uint8_t u, uint8_t v);

  private:
    const int width_;
    const int height_;
    int64_t timestamp_us_;
    std::vector<uint8_t> data_;
};

#endif // FRAME_BUFFER_H_
