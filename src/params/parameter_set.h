#ifndef PARAMETER_SET_H_
#define PARAMETER_SET_H_

#include <optional>

struct Resolution {
    int width;
    int height;

    bool operator==(const Resolution &other) const {
        return width == other.width && height == other.height;
    }
};

struct ParameterSet {
    int width = 848;
    int height = 480;
    int fps = 30;
    int record_fps = 30;
    // 0 means automatic exposure / gain
    int exposure_us = 0;
    float gain = 0.0f;
    double baseline_mm = 60.0;
    bool show_right = true;
    bool show_disparity = true;

    Resolution resolution() const { return {width, height}; }
};

// Fields left empty keep their current value.
struct ParameterPatch {
    std::optional<int> width;
    std::optional<int> height;
    std::optional<int> fps;
    std::optional<int> record_fps;
    std::optional<int> exposure_us;
    std::optional<float> gain;
    std::optional<double> baseline_mm;
    std::optional<bool> show_right;
    std::optional<bool> show_disparity;

    bool empty() const {
        return !width && !height && !fps && !record_fps && !exposure_us && !gain &&
               !baseline_mm && !show_right && !show_disparity;
    }
};

struct ParameterChange {
    bool resolution = false;
    bool fps = false;
    bool record_fps = false;
    bool exposure = false;
    bool baseline = false;
    bool view = false;

    bool any() const { return resolution || fps || record_fps || exposure || baseline || view; }
};

struct ParameterUpdate {
    ParameterSet params;
    ParameterSet previous;
    ParameterChange change;
};

#endif // PARAMETER_SET_H_
