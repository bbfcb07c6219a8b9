#include "control/api_json.h"

#include <climits>
#include <cstdio>

#include "common/errors.h"

namespace {

json Optional(const std::optional<double> &value) {
    return value ? json(*value) : json(nullptr);
}

int ReadInt(const json &value, const std::string &field) {
    if (!value.is_number_integer()) {
        throw ParameterError(field, "must be an integer");
    }
    auto number = value.get<long long>();
    if (number < INT_MIN || number > INT_MAX) {
        throw ParameterError(field, "is out of range");
    }
    return static_cast<int>(number);
}

double ReadNumber(const json &value, const std::string &field) {
    if (!value.is_number()) {
        throw ParameterError(field, "must be a number");
    }
    return value.get<double>();
}

bool ReadBool(const json &value, const std::string &field) {
    if (!value.is_boolean()) {
        throw ParameterError(field, "must be a boolean");
    }
    return value.get<bool>();
}

} // namespace

json ApiJson::ToJson(const ParameterSet &params) {
    json obj;
    obj["width"] = params.width;
    obj["height"] = params.height;
    obj["resolution"] = std::to_string(params.width) + "x" + std::to_string(params.height);
    obj["fps"] = params.fps;
    obj["record_fps"] = params.record_fps;
    obj["exposure_us"] = params.exposure_us;
    obj["gain"] = params.gain;
    obj["baseline_mm"] = params.baseline_mm;
    obj["show_right"] = params.show_right;
    obj["show_disparity"] = params.show_disparity;
    return obj;
}

json ApiJson::ToJson(const RecordingSession &session) {
    json obj;
    obj["id"] = session.id;
    obj["status"] = ToString(session.status);
    obj["start_time"] = session.start_time;
    obj["stop_time"] = Optional(session.stop_time);
    obj["output_path"] = session.output_path;
    obj["frames_written"] = session.frames_written;
    obj["frames_dropped"] = session.frames_dropped;
    obj["error"] = session.error ? json(*session.error) : json(nullptr);
    obj["encoder"] = session.encoder;
    obj["width"] = session.width;
    obj["height"] = session.height;
    obj["fps"] = session.fps;
    return obj;
}

json ApiJson::ToJson(const StatusSnapshot &snapshot) {
    json obj;
    obj["preview_fps"] = Optional(snapshot.preview_fps);
    obj["capture_fps"] = Optional(snapshot.capture_fps);
    obj["cpu_temp_c"] = Optional(snapshot.cpu_temp_c);
    obj["free_gb"] = Optional(snapshot.free_gb);
    obj["battery_v"] = Optional(snapshot.battery_v);
    obj["sampled_at"] = snapshot.sampled_at;
    obj["recording"] = snapshot.recording;
    obj["temp_warning"] = snapshot.temp_warning;
    obj["battery_warning"] = snapshot.battery_warning;
    obj["status_line"] = StatusAggregator::FormatStatusLine(snapshot);
    return obj;
}

json ApiJson::ErrorBody(const std::string &message, const std::string &field) {
    json obj;
    obj["error"] = message;
    if (!field.empty()) {
        obj["field"] = field;
    }
    return obj;
}

ParameterPatch ApiJson::ParsePatch(const json &body) {
    if (!body.is_object()) {
        throw ParameterError("body", "must be a JSON object");
    }

    ParameterPatch patch;
    for (auto it = body.begin(); it != body.end(); ++it) {
        const std::string &key = it.key();
        const json &value = it.value();

        if (key == "width") {
            patch.width = ReadInt(value, key);
        } else if (key == "height") {
            patch.height = ReadInt(value, key);
        } else if (key == "resolution") {
            int width = 0, height = 0;
            char tail = 0;
            if (!value.is_string() ||
                sscanf(value.get<std::string>().c_str(), "%dx%d%c", &width, &height, &tail) != 2) {
                throw ParameterError(key, "must look like \"848x480\"");
            }
            patch.width = width;
            patch.height = height;
        } else if (key == "fps") {
            patch.fps = ReadInt(value, key);
        } else if (key == "record_fps") {
            patch.record_fps = ReadInt(value, key);
        } else if (key == "exposure_us") {
            patch.exposure_us = ReadInt(value, key);
        } else if (key == "gain") {
            patch.gain = static_cast<float>(ReadNumber(value, key));
        } else if (key == "baseline_mm") {
            patch.baseline_mm = ReadNumber(value, key);
        } else if (key == "show_right") {
            patch.show_right = ReadBool(value, key);
        } else if (key == "show_disparity") {
            patch.show_disparity = ReadBool(value, key);
        } else {
            throw ParameterError(key, "is not a known parameter");
        }
    }
    return patch;
}
