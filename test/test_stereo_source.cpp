#include "capturer/fake_capturer.h"
#include "capturer/stereo_source.h"

#include <cassert>
#include <chrono>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

std::shared_ptr<FakeCapturer> MakeCamera(const std::string &name, int shift_px = 0) {
    CaptureConfig config;
    config.name = name;
    config.width = 320;
    config.height = 240;
    config.fps = 30;
    config.shift_px = shift_px;
    return FakeCapturer::Create(config);
}

std::shared_ptr<FrameBuffer> Frame(int64_t timestamp_us, int width = 320, int height = 240) {
    auto frame = FrameBuffer::Create(width, height);
    frame->SetTimestamp(timestamp_us);
    return frame;
}

struct Collector {
    std::mutex mtx;
    std::vector<FramePair> pairs;
    std::shared_ptr<Observable<FramePair>> observer;

    explicit Collector(std::shared_ptr<StereoSource> source) {
        observer = source->AsObservable();
        observer->Subscribe([this](FramePair &pair) {
            std::lock_guard<std::mutex> lock(mtx);
            pairs.push_back(pair);
        });
    }

    size_t size() {
        std::lock_guard<std::mutex> lock(mtx);
        return pairs.size();
    }
};

void TestExactPairing() {
    auto source = StereoSource::Create(MakeCamera("left"), MakeCamera("right"), 1000);
    Collector collector(source);

    source->PushLeft(Frame(100000));
    assert(collector.size() == 0);
    source->PushRight(Frame(100000));
    assert(collector.size() == 1);
    assert(collector.pairs[0].sequence == 1);
    assert(collector.pairs[0].timestamp_us == 100000);

    source->PushRight(Frame(133000));
    source->PushLeft(Frame(133500));
    assert(collector.size() == 2);
    assert(collector.pairs[1].sequence == 2);
    assert(collector.pairs[1].timestamp_us == 133500);
    assert(collector.pairs[1].right->timestamp_us() == 133000);
    assert(source->pairs() == 2);
    assert(source->dropped_left() == 0 && source->dropped_right() == 0);
}

void TestStaleFramesAreDropped() {
    auto source = StereoSource::Create(MakeCamera("left"), MakeCamera("right"), 1000);
    Collector collector(source);

    // right frames far older than the left frame can never be paired
    source->PushRight(Frame(10000));
    source->PushRight(Frame(20000));
    source->PushLeft(Frame(50000));
    assert(collector.size() == 0);
    assert(source->dropped_right() == 2);

    // a right frame newer than the tolerance leaves the left frame orphaned
    source->PushRight(Frame(80000));
    assert(collector.size() == 0);
    assert(source->dropped_left() == 1);

    source->PushLeft(Frame(80200));
    assert(collector.size() == 1);
    assert(collector.pairs[0].right->timestamp_us() == 80000);
}

void TestNewestMatchWins() {
    auto source = StereoSource::Create(MakeCamera("left"), MakeCamera("right"), 5000);
    Collector collector(source);

    source->PushRight(Frame(96000));
    source->PushRight(Frame(99000));
    source->PushRight(Frame(104000));
    source->PushLeft(Frame(100000));
    assert(collector.size() == 1);
    assert(collector.pairs[0].right->timestamp_us() == 104000);
    assert(source->dropped_right() == 2);
}

void TestDefaultTolerance() {
    auto source = StereoSource::Create(MakeCamera("left"), MakeCamera("right"));
    // half of a 30 fps period
    assert(source->tolerance_us() == 16666);
    source->SetTolerance(2000);
    assert(source->tolerance_us() == 2000);
}

void TestRightIsScaledToLeft() {
    auto source = StereoSource::Create(MakeCamera("left"), MakeCamera("right"), 1000);
    Collector collector(source);

    source->PushLeft(Frame(1000, 320, 240));
    source->PushRight(Frame(1000, 640, 480));
    assert(collector.size() == 1);
    assert(collector.pairs[0].right->width() == 320);
    assert(collector.pairs[0].right->height() == 240);
}

void TestLiveFakeCameras() {
    auto source = StereoSource::Create(MakeCamera("left"), MakeCamera("right", 18));
    Collector collector(source);

    source->StartCapture();
    assert(source->is_capturing());
    std::this_thread::sleep_for(std::chrono::milliseconds(600));
    source->StopCapture();
    assert(!source->is_capturing());

    std::lock_guard<std::mutex> lock(collector.mtx);
    assert(collector.pairs.size() >= 5);
    uint64_t last_sequence = 0;
    for (auto &pair : collector.pairs) {
        assert(pair.sequence > last_sequence);
        last_sequence = pair.sequence;
        assert(pair.left->timestamp_us() == pair.right->timestamp_us());
        assert(pair.left->width() == pair.right->width());
        assert(pair.left->height() == pair.right->height());
    }
}

int main(int argc, char *argv[]) {
    TestExactPairing();
    TestStaleFramesAreDropped();
    TestNewestMatchWins();
    TestDefaultTolerance();
    TestRightIsScaledToLeft();
    TestLiveFakeCameras();
    std::cout << "test_stereo_source passed" << std::endl;
    return 0;
}
