#include "capturer/libcamera_capturer.h"
#include "common/errors.h"
#include "common/utils.h"

#include <condition_variable>
#include <cstdlib>
#include <iostream>
#include <mutex>

int main(int argc, char *argv[]) {
    std::mutex mtx;
    std::condition_variable cond_var;
    bool is_finished = false;
    int i = 0;
    int images_nb = 10;

    CaptureConfig config;
    config.name = "left";
    config.camera_index = argc > 1 ? atoi(argv[1]) : 0;
    config.width = 1280;
    config.height = 720;
    config.fps = 30;
    config.format = V4L2_PIX_FMT_YUV420;

    std::shared_ptr<LibcameraCapturer> capturer;
    try {
        capturer = LibcameraCapturer::Create(config);
        capturer->StartCapture();
    } catch (const CaptureError &e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    auto observer = capturer->AsFrameBufferObservable();
    observer->Subscribe([&](VideoCapturer::FrameBufferPtr &frame) {
        std::lock_guard<std::mutex> lock(mtx);
        if (i < images_nb) {
            std::string filename = "img" + std::to_string(++i) + ".jpg";
            printf("frame %d: %dx%d at %lld us -> %s\n", i, frame->width(), frame->height(),
                   static_cast<long long>(frame->timestamp_us()), filename.c_str());
            Utils::CreateJpegImage(*frame, filename);
        } else {
            is_finished = true;
            cond_var.notify_all();
        }
    });

    std::unique_lock<std::mutex> lock(mtx);
    cond_var.wait(lock, [&] {
        return is_finished;
    });
    lock.unlock();
    capturer->StopCapture();
    return 0;
}
