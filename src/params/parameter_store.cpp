#include "params/parameter_store.h"

#include <algorithm>
#include <cmath>
#include <string>

#include "common/errors.h"
#include "common/logging.h"

const std::vector<Resolution> &ParameterStore::SupportedResolutions() {
    static const std::vector<Resolution> resolutions = {
        {640, 480},
        {848, 480},
        {960, 540},
        {1280, 720},
    };
    return resolutions;
}

ParameterStore::ParameterStore(ParameterSet initial)
    : params_(initial),
      resolution_locked_(false) {
    Validate(params_);
}

ParameterSet ParameterStore::Get() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return params_;
}

void ParameterStore::Validate(const ParameterSet &params) {
    auto &resolutions = SupportedResolutions();
    if (std::find(resolutions.begin(), resolutions.end(), params.resolution()) ==
        resolutions.end()) {
        throw ParameterError("resolution", std::to_string(params.width) + "x" +
                                               std::to_string(params.height) +
                                               " is not supported");
    }
    if (params.fps < kMinFps || params.fps > kMaxFps) {
        throw ParameterError("fps", "must be within " + std::to_string(kMinFps) + "-" +
                                        std::to_string(kMaxFps));
    }
    if (params.record_fps < kMinFps || params.record_fps > kMaxFps) {
        throw ParameterError("record_fps", "must be within " + std::to_string(kMinFps) + "-" +
                                               std::to_string(kMaxFps));
    }
    if (params.exposure_us < 0 || params.exposure_us > kMaxExposureUs) {
        throw ParameterError("exposure_us",
                             "must be within 0-" + std::to_string(kMaxExposureUs));
    }
    if (!std::isfinite(params.gain) || params.gain < 0.0f || params.gain > kMaxGain) {
        throw ParameterError("gain", "must be within 0-16");
    }
    if (!std::isfinite(params.baseline_mm) || params.baseline_mm <= 0.0 ||
        params.baseline_mm > kMaxBaselineMm) {
        throw ParameterError("baseline_mm", "must be within (0, 1000]");
    }
}

ParameterSet ParameterStore::Apply(const ParameterSet &current, const ParameterPatch &patch) {
    ParameterSet next = current;
    next.width = patch.width.value_or(next.width);
    next.height = patch.height.value_or(next.height);
    next.fps = patch.fps.value_or(next.fps);
    next.record_fps = patch.record_fps.value_or(next.record_fps);
    next.exposure_us = patch.exposure_us.value_or(next.exposure_us);
    next.gain = patch.gain.value_or(next.gain);
    next.baseline_mm = patch.baseline_mm.value_or(next.baseline_mm);
    next.show_right = patch.show_right.value_or(next.show_right);
    next.show_disparity = patch.show_disparity.value_or(next.show_disparity);
    return next;
}

ParameterChange ParameterStore::Diff(const ParameterSet &before, const ParameterSet &after) {
    ParameterChange change;
    change.resolution = !(before.resolution() == after.resolution());
    change.fps = before.fps != after.fps;
    change.record_fps = before.record_fps != after.record_fps;
    change.exposure = before.exposure_us != after.exposure_us || before.gain != after.gain;
    change.baseline = before.baseline_mm != after.baseline_mm;
    change.view = before.show_right != after.show_right ||
                  before.show_disparity != after.show_disparity;
    return change;
}

ParameterChange ParameterStore::Update(const ParameterPatch &patch) {
    ParameterUpdate update;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        ParameterSet next = Apply(params_, patch);
        Validate(next);

        update.change = Diff(params_, next);
        if (update.change.resolution && resolution_locked_.load()) {
            throw ParameterError("resolution", "resolution is locked while recording",
                                 ParameterError::Reason::LOCKED);
        }
        if (!update.change.any()) {
            return update.change;
        }
        update.previous = params_;
        params_ = next;
        update.params = next;
    }

    INFO_PRINT("parameters updated: %dx%d@%d, record %dfps, exposure %dus, gain %.2f, "
               "baseline %.1fmm, right %s, disparity %s",
               update.params.width, update.params.height, update.params.fps,
               update.params.record_fps, update.params.exposure_us, update.params.gain,
               update.params.baseline_mm, update.params.show_right ? "on" : "off",
               update.params.show_disparity ? "on" : "off");
    Next(update);
    return update.change;
}

void ParameterStore::Restore(const ParameterSet &params) {
    std::lock_guard<std::mutex> lock(mtx_);
    params_ = params;
    INFO_PRINT("parameters restored: %dx%d@%d", params.width, params.height, params.fps);
}

void ParameterStore::LockResolution(bool locked) { resolution_locked_.store(locked); }

bool ParameterStore::resolution_locked() const { return resolution_locked_.load(); }
