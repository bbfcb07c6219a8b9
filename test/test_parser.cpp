#include "parser.h"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

bool Parse(std::vector<std::string> options, Args &args) {
    options.insert(options.begin(), "stereo_rig");
    std::vector<char *> argv;
    for (auto &option : options) {
        argv.push_back(option.data());
    }
    return Parser::ParseArgs(static_cast<int>(argv.size()), argv.data(), args);
}

void TestDefaults() {
    Args args;
    assert(Parse({}, args));
    assert(args.source == "fake");
    assert(args.width == 848 && args.height == 480 && args.fps == 30);
    assert(args.format == V4L2_PIX_FMT_MJPEG);
    assert(args.show_right && args.show_disparity);
    assert(!args.start_preview);
    assert(args.record_path == "/var/lib/stereo-rig/");
    assert(args.http_port == 8080);
}

void TestOverrides() {
    Args args;
    assert(Parse({"--source=v4l2", "--left_device=/dev/video4", "--right_device=/dev/video6",
                  "--v4l2_format=yuyv", "--width=1280", "--height=720", "--no_right",
                  "--preview", "--record_path=/tmp/rig", "--http_port=9000"},
                 args));
    assert(args.source == "v4l2");
    assert(args.left_device == "/dev/video4" && args.right_device == "/dev/video6");
    assert(args.format == V4L2_PIX_FMT_YUYV);
    assert(args.width == 1280 && args.height == 720);
    assert(!args.show_right && args.show_disparity);
    assert(args.start_preview);
    assert(args.record_path == "/tmp/rig/");
    assert(args.http_port == 9000);

    Args camera_args;
    assert(Parse({"--source=libcamera", "--left_camera=1", "--right_camera=0"}, camera_args));
    assert(camera_args.format == V4L2_PIX_FMT_YUV420);
}

void TestRejectsInvalid() {
    Args args;
    assert(!Parse({"--help"}, args));
    assert(!Parse({"--source=usb"}, args));
    assert(!Parse({"--source=v4l2", "--left_device=/dev/video0", "--right_device=/dev/video0"},
                  args));
    assert(!Parse({"--source=libcamera", "--left_camera=0", "--right_camera=0"}, args));
    assert(!Parse({"--v4l2_format=h265"}, args));
    assert(!Parse({"--record_path=recordings"}, args));
    assert(!Parse({"--jpeg_quality=0"}, args));
    assert(!Parse({"--http_port=70000"}, args));
    assert(!Parse({"--stats_interval_ms=10"}, args));
    assert(!Parse({"--record_queue=0"}, args));
    assert(!Parse({"--width=wide"}, args));
    assert(!Parse({"--unknown_option"}, args));
}

int main(int argc, char *argv[]) {
    TestDefaults();
    TestOverrides();
    TestRejectsInvalid();

    std::cout << "test_parser passed" << std::endl;
    return 0;
}
