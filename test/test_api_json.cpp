#include "common/errors.h"
#include "control/api_json.h"

#include <cassert>
#include <iostream>

template <typename Fn> std::string RejectedField(Fn fn) {
    try {
        fn();
    } catch (const ParameterError &e) {
        return e.field();
    }
    return "";
}

void TestParameterSetJson() {
    ParameterSet params;
    params.exposure_us = 5000;
    auto obj = ApiJson::ToJson(params);
    assert(obj["width"] == 848 && obj["height"] == 480);
    assert(obj["resolution"] == "848x480");
    assert(obj["fps"] == 30 && obj["record_fps"] == 30);
    assert(obj["exposure_us"] == 5000);
    assert(obj["baseline_mm"] == 60.0);
    assert(obj["show_right"] == true && obj["show_disparity"] == true);
}

void TestSessionJson() {
    RecordingSession session;
    session.id = "0f8e2c3a-1111-2222-3333-444455556666";
    session.status = SessionStatus::FAILED;
    session.frames_written = 12;
    session.frames_dropped = 3;
    session.error = "storage full";
    auto obj = ApiJson::ToJson(session);
    assert(obj["status"] == "failed");
    assert(obj["frames_written"] == 12 && obj["frames_dropped"] == 3);
    assert(obj["error"] == "storage full");
    assert(obj["stop_time"].is_null());

    RecordingSession active;
    active.status = SessionStatus::RECORDING;
    auto active_obj = ApiJson::ToJson(active);
    assert(active_obj["status"] == "recording");
    assert(active_obj["error"].is_null());
}

void TestStatusJson() {
    StatusSnapshot snapshot;
    snapshot.preview_fps = 29.9;
    snapshot.battery_v = 7.41;
    auto obj = ApiJson::ToJson(snapshot);
    assert(obj["preview_fps"] == 29.9);
    assert(obj["cpu_temp_c"].is_null());
    assert(obj["battery_v"] == 7.41);
    assert(obj["recording"] == false);
    assert(obj["temp_warning"] == false && obj["battery_warning"] == false);
    assert(obj["status_line"] == "FPS: 29.9 | CPU: -- | Free: -- | Batt: 7.41 V");
}

void TestParsePatch() {
    auto patch = ApiJson::ParsePatch(json::parse(
        R"({"fps": 60, "gain": 2, "baseline_mm": 62.5, "show_right": false, "resolution": "1280x720"})"));
    assert(patch.fps == 60);
    assert(patch.gain == 2.0f);
    assert(patch.baseline_mm == 62.5);
    assert(patch.show_right == false);
    assert(patch.width == 1280 && patch.height == 720);
    assert(!patch.record_fps && !patch.exposure_us && !patch.show_disparity);

    assert(ApiJson::ParsePatch(json::object()).empty());

    auto sized = ApiJson::ParsePatch(json::parse(R"({"width": 640, "height": 480})"));
    assert(sized.width == 640 && sized.height == 480);
}

void TestRejectedPatches() {
    assert(RejectedField([] { ApiJson::ParsePatch(json::parse("[1, 2]")); }) == "body");
    assert(RejectedField([] { ApiJson::ParsePatch(json::parse(R"({"iso": 100})")); }) == "iso");
    assert(RejectedField([] { ApiJson::ParsePatch(json::parse(R"({"fps": "30"})")); }) == "fps");
    assert(RejectedField([] { ApiJson::ParsePatch(json::parse(R"({"fps": 29.97})")); }) == "fps");
    assert(RejectedField([] {
               ApiJson::ParsePatch(json::parse(R"({"show_right": 1})"));
           }) == "show_right");
    assert(RejectedField([] {
               ApiJson::ParsePatch(json::parse(R"({"resolution": "big"})"));
           }) == "resolution");
    assert(RejectedField([] {
               ApiJson::ParsePatch(json::parse(R"({"exposure_us": 99999999999})"));
           }) == "exposure_us");
}

void TestErrorBody() {
    auto body = ApiJson::ErrorBody("fps: must be within 5-120", "fps");
    assert(body["error"] == "fps: must be within 5-120");
    assert(body["field"] == "fps");
    assert(!ApiJson::ErrorBody("preview is not running").contains("field"));
}

int main(int argc, char *argv[]) {
    TestParameterSetJson();
    TestSessionJson();
    TestStatusJson();
    TestParsePatch();
    TestRejectedPatches();
    TestErrorBody();
    std::cout << "test_api_json passed" << std::endl;
    return 0;
}
