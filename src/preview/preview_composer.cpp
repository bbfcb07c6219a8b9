#include "preview/preview_composer.h"

#include <cstdlib>
#include <cstring>

#include <libyuv.h>

PreviewComposer::PreviewComposer(bool show_right, bool show_disparity, int target_fps)
    : show_right_(show_right),
      show_disparity_(show_disparity),
      gate_(target_fps) {}

void PreviewComposer::SetView(bool show_right, bool show_disparity) {
    std::lock_guard<std::mutex> lock(mtx_);
    show_right_ = show_right;
    show_disparity_ = show_disparity;
}

void PreviewComposer::SetTargetFps(int fps) { gate_.SetFps(fps); }

int PreviewComposer::PanelCount(bool show_right, bool show_disparity) {
    return 1 + (show_right ? 1 : 0) + (show_disparity ? 1 : 0);
}

int PreviewComposer::PanelCount() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return PanelCount(show_right_, show_disparity_);
}

std::shared_ptr<FrameBuffer> PreviewComposer::Offer(const FramePair &pair) {
    if (!gate_.Admit(pair.timestamp_us)) {
        return nullptr;
    }

    auto composite = ComposeCurrent(pair);

    std::lock_guard<std::mutex> lock(mtx_);
    latest_ = composite;
    return composite;
}

std::shared_ptr<FrameBuffer> PreviewComposer::ComposeCurrent(const FramePair &pair) const {
    bool show_right, show_disparity;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        show_right = show_right_;
        show_disparity = show_disparity_;
    }
    return Compose(pair, show_right, show_disparity);
}

std::shared_ptr<FrameBuffer> PreviewComposer::latest() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return latest_;
}

void PreviewComposer::Clear() {
    std::lock_guard<std::mutex> lock(mtx_);
    latest_.reset();
    gate_.Reset();
}

std::shared_ptr<FrameBuffer> PreviewComposer::Compose(const FramePair &pair, bool show_right,
                                                      bool show_disparity) {
    if (!pair.left || !pair.right) {
        return nullptr;
    }

    int w = pair.width();
    int h = pair.height();
    auto composite = FrameBuffer::Create(w * PanelCount(show_right, show_disparity), h);
    composite->SetTimestamp(pair.timestamp_us);

    int x = 0;
    CopyPanel(*pair.left, composite.get(), x);
    x += w;
    if (show_right) {
        CopyPanel(*pair.right, composite.get(), x);
        x += w;
    }
    if (show_disparity) {
        DifferencePanel(*pair.left, *pair.right, composite.get(), x);
    }
    return composite;
}

void PreviewComposer::CopyPanel(const FrameBuffer &src, FrameBuffer *dst, int x) {
    libyuv::CopyPlane(src.DataY(), src.StrideY(), dst->MutableDataY() + x, dst->StrideY(),
                      src.width(), src.height());
    libyuv::CopyPlane(src.DataU(), src.StrideU(), dst->MutableDataU() + x / 2, dst->StrideU(),
                      src.StrideU(), src.ChromaHeight());
    libyuv::CopyPlane(src.DataV(), src.StrideV(), dst->MutableDataV() + x / 2, dst->StrideV(),
                      src.StrideV(), src.ChromaHeight());
}

void PreviewComposer::DifferencePanel(const FrameBuffer &left, const FrameBuffer &right,
                                      FrameBuffer *dst, int x) {
    for (int y = 0; y < left.height(); y++) {
        const uint8_t *l = left.DataY() + y * left.StrideY();
        const uint8_t *r = right.DataY() + y * right.StrideY();
        uint8_t *d = dst->MutableDataY() + y * dst->StrideY() + x;
        for (int i = 0; i < left.width(); i++) {
            d[i] = static_cast<uint8_t>(std::abs(l[i] - r[i]));
        }
    }
    for (int y = 0; y < left.ChromaHeight(); y++) {
        memset(dst->MutableDataU() + y * dst->StrideU() + x / 2, 128, left.StrideU());
        memset(dst->MutableDataV() + y * dst->StrideV() + x / 2, 128, left.StrideV());
    }
}
