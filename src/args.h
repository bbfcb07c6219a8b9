#ifndef ARGS_H_
#define ARGS_H_

#include <string>

#include <linux/videodev2.h>

struct Args {
    // capture
    std::string source = "fake";
    std::string left_device = "/dev/video0";
    std::string right_device = "/dev/video2";
    int left_camera = 0;
    int right_camera = 1;
    std::string v4l2_format = "mjpeg";
    uint32_t format = V4L2_PIX_FMT_MJPEG;
    int width = 848;
    int height = 480;
    int fps = 30;
    int exposure = 0;
    float gain = 0.0f;
    int pair_tolerance_us = 0;

    // preview
    bool show_right = true;
    bool show_disparity = true;
    bool start_preview = false;
    int jpeg_quality = 80;

    // stereo
    double baseline_mm = 60.0;

    // recording
    int record_fps = 30;
    int record_queue = 8;
    unsigned long min_free_mb = 400;
    std::string record_path = "/var/lib/stereo-rig/";

    // status
    int stats_interval_ms = 1000;
    std::string thermal_path = "/sys/class/thermal/thermal_zone0/temp";
    std::string battery_path = "";
    double battery_scale = 1e-6;
    double temp_warn_c = 80.0;
    double battery_warn_v = 0.0;

    // control service
    int http_port = 8080;
};

#endif // ARGS_H_
