#ifndef FRAME_PAIR_H_
#define FRAME_PAIR_H_

#include <cstdint>
#include <memory>

#include "common/frame_buffer.h"

struct FramePair {
    uint64_t sequence = 0;
    // timestamp of the left frame, microseconds on the capture clock
    int64_t timestamp_us = 0;
    std::shared_ptr<FrameBuffer> left;
    std::shared_ptr<FrameBuffer> right;

    int width() const { return left ? left->width() : 0; }
    int height() const { return left ? left->height() : 0; }
};

#endif // FRAME_PAIR_H_
