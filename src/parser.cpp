#include "parser.h"

#include <boost/program_options.hpp>
#include <iostream>
#include <string>

#include "common/v4l2_utils.h"

namespace bpo = boost::program_options;

bool Parser::ParseArgs(int argc, char *argv[], Args &args) {
    bpo::options_description opts("Options");
    // clang-format off
    opts.add_options()
        ("help,h", "Display the help message")
        ("source", bpo::value<std::string>()->default_value(args.source),
         "Camera backend: `fake`, `v4l2` or `libcamera`")
        ("left_device", bpo::value<std::string>()->default_value(args.left_device),
         "V4L2 device of the left camera")
        ("right_device", bpo::value<std::string>()->default_value(args.right_device),
         "V4L2 device of the right camera")
        ("left_camera", bpo::value<int>()->default_value(args.left_camera),
         "libcamera index of the left camera")
        ("right_camera", bpo::value<int>()->default_value(args.right_camera),
         "libcamera index of the right camera")
        ("v4l2_format", bpo::value<std::string>()->default_value(args.v4l2_format),
         "Set v4l2 camera capture format to `mjpeg`, `yuyv` or `i420`")
        ("width", bpo::value<int>()->default_value(args.width), "Set camera frame width")
        ("height", bpo::value<int>()->default_value(args.height), "Set camera frame height")
        ("fps", bpo::value<int>()->default_value(args.fps), "Set preview frame rate")
        ("record_fps", bpo::value<int>()->default_value(args.record_fps),
         "Set the frame rate written into recordings")
        ("exposure", bpo::value<int>()->default_value(args.exposure),
         "Exposure time in microseconds, 0 for auto exposure")
        ("gain", bpo::value<float>()->default_value(args.gain),
         "Analogue gain, 0 for automatic gain")
        ("pair_tolerance_us", bpo::value<int>()->default_value(args.pair_tolerance_us),
         "Max timestamp gap between a left and right frame, 0 for half a frame period")
        ("baseline_mm", bpo::value<double>()->default_value(args.baseline_mm),
         "Stereo baseline in millimetres")
        ("no_right", bpo::bool_switch()->default_value(false),
         "Hide the right view in the preview")
        ("no_disparity", bpo::bool_switch()->default_value(false),
         "Hide the disparity view in the preview")
        ("preview", bpo::bool_switch()->default_value(args.start_preview),
         "Start the preview at boot")
        ("jpeg_quality", bpo::value<int>()->default_value(args.jpeg_quality),
         "Quality of served preview and snapshot images (1-100)")
        ("record_path", bpo::value<std::string>()->default_value(args.record_path),
         "The path to save the recording files")
        ("record_queue", bpo::value<int>()->default_value(args.record_queue),
         "Frames buffered in front of the encoder before new frames are dropped")
        ("min_free_mb", bpo::value<unsigned long>()->default_value(args.min_free_mb),
         "Refuse or stop recording below this amount of free storage")
        ("stats_interval_ms", bpo::value<int>()->default_value(args.stats_interval_ms),
         "Status polling period")
        ("thermal_path", bpo::value<std::string>()->default_value(args.thermal_path),
         "sysfs file reporting the cpu temperature in milli-degrees")
        ("battery_path", bpo::value<std::string>()->default_value(args.battery_path),
         "sysfs file reporting the battery voltage, e.g. "
         "/sys/class/power_supply/BAT0/voltage_now. Empty to disable")
        ("battery_scale", bpo::value<double>()->default_value(args.battery_scale),
         "Multiplier converting the battery reading to volts, 1e-6 for microvolts")
        ("temp_warn_c", bpo::value<double>()->default_value(args.temp_warn_c),
         "Log a warning above this cpu temperature")
        ("battery_warn_v", bpo::value<double>()->default_value(args.battery_warn_v),
         "Log a warning below this battery voltage, 0 to disable")
        ("http_port", bpo::value<int>()->default_value(args.http_port),
         "Port of the control service");
    // clang-format on

    bpo::variables_map vm;
    try {
        bpo::store(bpo::parse_command_line(argc, argv, opts), vm);
        bpo::notify(vm);
    } catch (const bpo::error &e) {
        std::cerr << e.what() << std::endl;
        std::cerr << opts << std::endl;
        return false;
    }

    if (vm.count("help")) {
        std::cout << opts << std::endl;
        return false;
    }

    args.source = vm["source"].as<std::string>();
    if (args.source != "fake" && args.source != "v4l2" && args.source != "libcamera") {
        std::cerr << "The source should be one of `fake`, `v4l2` or `libcamera`" << std::endl;
        return false;
    }

    args.left_device = vm["left_device"].as<std::string>();
    args.right_device = vm["right_device"].as<std::string>();
    args.left_camera = vm["left_camera"].as<int>();
    args.right_camera = vm["right_camera"].as<int>();
    if (args.source == "v4l2" && args.left_device == args.right_device) {
        std::cerr << "The left and right devices must differ" << std::endl;
        return false;
    }
    if (args.source == "libcamera" && args.left_camera == args.right_camera) {
        std::cerr << "The left and right cameras must differ" << std::endl;
        return false;
    }

    args.v4l2_format = vm["v4l2_format"].as<std::string>();
    if (args.source == "libcamera") {
        args.format = V4L2_PIX_FMT_YUV420;
    } else {
        args.format = V4l2Util::FormatFromString(args.v4l2_format);
        if (args.format == 0) {
            std::cerr << "Unknown v4l2_format `" << args.v4l2_format << "`" << std::endl;
            return false;
        }
    }

    args.width = vm["width"].as<int>();
    args.height = vm["height"].as<int>();
    args.fps = vm["fps"].as<int>();
    args.record_fps = vm["record_fps"].as<int>();
    args.exposure = vm["exposure"].as<int>();
    args.gain = vm["gain"].as<float>();
    args.pair_tolerance_us = vm["pair_tolerance_us"].as<int>();
    args.baseline_mm = vm["baseline_mm"].as<double>();
    args.show_right = !vm["no_right"].as<bool>();
    args.show_disparity = !vm["no_disparity"].as<bool>();
    args.start_preview = vm["preview"].as<bool>();

    args.jpeg_quality = vm["jpeg_quality"].as<int>();
    if (args.jpeg_quality < 1 || args.jpeg_quality > 100) {
        std::cerr << "The jpeg_quality should be within 1-100" << std::endl;
        return false;
    }

    auto record_path = vm["record_path"].as<std::string>();
    if (record_path.empty() || record_path.front() != '/') {
        std::cerr << "The record path needs to start with a \"/\" character" << std::endl;
        return false;
    }
    args.record_path = record_path.back() == '/' ? record_path : record_path + '/';

    args.record_queue = vm["record_queue"].as<int>();
    if (args.record_queue < 1) {
        std::cerr << "The record_queue should be at least 1" << std::endl;
        return false;
    }
    args.min_free_mb = vm["min_free_mb"].as<unsigned long>();

    args.stats_interval_ms = vm["stats_interval_ms"].as<int>();
    if (args.stats_interval_ms < 100) {
        std::cerr << "The stats_interval_ms should be at least 100" << std::endl;
        return false;
    }
    args.thermal_path = vm["thermal_path"].as<std::string>();
    args.battery_path = vm["battery_path"].as<std::string>();
    args.battery_scale = vm["battery_scale"].as<double>();
    args.temp_warn_c = vm["temp_warn_c"].as<double>();
    args.battery_warn_v = vm["battery_warn_v"].as<double>();

    args.http_port = vm["http_port"].as<int>();
    if (args.http_port <= 0 || args.http_port > 65535) {
        std::cerr << "The http_port should be within 1-65535" << std::endl;
        return false;
    }

    return true;
}
