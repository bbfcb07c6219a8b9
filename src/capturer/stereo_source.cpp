#include "capturer/stereo_source.h"

#include <algorithm>
#include <cstdlib>

#include <libyuv.h>

#include "common/logging.h"

std::shared_ptr<StereoSource> StereoSource::Create(std::shared_ptr<VideoCapturer> left,
                                                   std::shared_ptr<VideoCapturer> right,
                                                   int tolerance_us) {
    auto ptr = std::make_shared<StereoSource>(left, right, tolerance_us);

    if (left) {
        ptr->left_observer_ = left->AsFrameBufferObservable();
        ptr->left_observer_->Subscribe([raw = ptr.get()](VideoCapturer::FrameBufferPtr &frame) {
            raw->PushLeft(frame);
        });
    }
    if (right) {
        ptr->right_observer_ = right->AsFrameBufferObservable();
        ptr->right_observer_->Subscribe([raw = ptr.get()](VideoCapturer::FrameBufferPtr &frame) {
            raw->PushRight(frame);
        });
    }
    return ptr;
}

StereoSource::StereoSource(std::shared_ptr<VideoCapturer> left,
                           std::shared_ptr<VideoCapturer> right, int tolerance_us)
    : tolerance_us_(tolerance_us),
      sequence_(0),
      dropped_left_(0),
      dropped_right_(0),
      left_(left),
      right_(right) {}

StereoSource::~StereoSource() {
    if (left_observer_) {
        left_observer_->UnSubscribe();
    }
    if (right_observer_) {
        right_observer_->UnSubscribe();
    }
    StopCapture();
    UnSubscribe();
}

void StereoSource::StartCapture() {
    // start the right camera first so the first left frames find a partner
    if (right_) {
        right_->StartCapture();
    }
    if (left_) {
        try {
            left_->StartCapture();
        } catch (...) {
            if (right_) {
                right_->StopCapture();
            }
            throw;
        }
    }
}

void StereoSource::StopCapture() {
    if (left_) {
        left_->StopCapture();
    }
    if (right_) {
        right_->StopCapture();
    }

    std::lock_guard<std::mutex> lock(mtx_);
    pending_left_.clear();
    pending_right_.clear();
}

bool StereoSource::is_capturing() const {
    return left_ && right_ && left_->is_capturing() && right_->is_capturing();
}

void StereoSource::PushLeft(std::shared_ptr<FrameBuffer> frame) {
    std::lock_guard<std::mutex> lock(mtx_);
    pending_left_.push_back(frame);
    if (pending_left_.size() > kMaxPending) {
        pending_left_.pop_front();
        dropped_left_++;
    }
    Match();
}

void StereoSource::PushRight(std::shared_ptr<FrameBuffer> frame) {
    std::lock_guard<std::mutex> lock(mtx_);
    pending_right_.push_back(frame);
    if (pending_right_.size() > kMaxPending) {
        pending_right_.pop_front();
        dropped_right_++;
    }
    Match();
}

void StereoSource::SetTolerance(int tolerance_us) {
    std::lock_guard<std::mutex> lock(mtx_);
    tolerance_us_ = tolerance_us;
}

int StereoSource::tolerance_us() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return EffectiveTolerance();
}

uint64_t StereoSource::pairs() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return sequence_;
}

uint64_t StereoSource::dropped_left() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return dropped_left_;
}

uint64_t StereoSource::dropped_right() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return dropped_right_;
}

std::shared_ptr<VideoCapturer> StereoSource::left() const { return left_; }

std::shared_ptr<VideoCapturer> StereoSource::right() const { return right_; }

int StereoSource::EffectiveTolerance() const {
    if (tolerance_us_ > 0) {
        return tolerance_us_;
    }
    int fps = left_ ? left_->fps() : 30;
    return 500000 / std::max(1, fps);
}

void StereoSource::Match() {
    const int64_t tolerance = EffectiveTolerance();

    while (!pending_left_.empty() && !pending_right_.empty()) {
        auto left = pending_left_.front();
        int64_t left_ts = left->timestamp_us();

        // right frames too old for this left frame can't match any later one either
        while (!pending_right_.empty() &&
               pending_right_.front()->timestamp_us() < left_ts - tolerance) {
            pending_right_.pop_front();
            dropped_right_++;
        }
        if (pending_right_.empty()) {
            return;
        }

        // newest right frame within tolerance
        int match = -1;
        for (size_t i = 0; i < pending_right_.size(); i++) {
            if (std::llabs(pending_right_[i]->timestamp_us() - left_ts) <= tolerance) {
                match = static_cast<int>(i);
            }
        }

        if (match < 0) {
            // the oldest right frame is already newer than this left frame can reach
            pending_left_.pop_front();
            dropped_left_++;
            continue;
        }

        auto right = pending_right_[match];
        dropped_right_ += match;
        pending_right_.erase(pending_right_.begin(), pending_right_.begin() + match + 1);
        pending_left_.pop_front();

        FramePair pair;
        pair.sequence = ++sequence_;
        pair.timestamp_us = left_ts;
        pair.left = left;
        pair.right = FitToLeft(left, right);
        Next(pair);
    }
}

std::shared_ptr<FrameBuffer>
StereoSource::FitToLeft(const std::shared_ptr<FrameBuffer> &left,
                        const std::shared_ptr<FrameBuffer> &right) const {
    if (right->width() == left->width() && right->height() == left->height()) {
        return right;
    }

    auto scaled = FrameBuffer::Create(left->width(), left->height());
    scaled->SetTimestamp(right->timestamp_us());
    libyuv::I420Scale(right->DataY(), right->StrideY(), right->DataU(), right->StrideU(),
                      right->DataV(), right->StrideV(), right->width(), right->height(),
                      scaled->MutableDataY(), scaled->StrideY(), scaled->MutableDataU(),
                      scaled->StrideU(), scaled->MutableDataV(), scaled->StrideV(),
                      scaled->width(), scaled->height(), libyuv::kFilterBilinear);
    DEBUG_PRINT("right frame scaled from %dx%d to %dx%d", right->width(), right->height(),
                left->width(), left->height());
    return scaled;
}
