#ifndef PREVIEW_COMPOSER_H_
#define PREVIEW_COMPOSER_H_

#include <memory>
#include <mutex>

#include "capturer/frame_pair.h"
#include "common/frame_buffer.h"
#include "preview/frame_gate.h"

/*
 * Builds the operator preview: left | right | disparity, side by side. The
 * disparity panel is the absolute luma difference between the two views, a
 * stand-in until the vision pipeline publishes a real disparity map.
 */
class PreviewComposer {
  public:
    PreviewComposer(bool show_right = true, bool show_disparity = true, int target_fps = 30);

    void SetView(bool show_right, bool show_disparity);
    void SetTargetFps(int fps);

    // Composes the pair unless it arrives sooner than one target frame period
    // after the previous composite; skipped pairs return nullptr.
    std::shared_ptr<FrameBuffer> Offer(const FramePair &pair);
    // Composes with the current view flags, bypassing the rate limit and cache.
    std::shared_ptr<FrameBuffer> ComposeCurrent(const FramePair &pair) const;
    std::shared_ptr<FrameBuffer> latest() const;
    void Clear();

    static std::shared_ptr<FrameBuffer> Compose(const FramePair &pair, bool show_right,
                                                bool show_disparity);
    static int PanelCount(bool show_right, bool show_disparity);
    int PanelCount() const;

  private:
    mutable std::mutex mtx_;
    bool show_right_;
    bool show_disparity_;
    FrameGate gate_;
    std::shared_ptr<FrameBuffer> latest_;

    static void CopyPanel(const FrameBuffer &src, FrameBuffer *dst, int x);
    static void DifferencePanel(const FrameBuffer &left, const FrameBuffer &right,
                                FrameBuffer *dst, int x);
};

#endif // PREVIEW_COMPOSER_H_
