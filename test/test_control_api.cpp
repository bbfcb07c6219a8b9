#include "control/control_api.h"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

ControlApi::Request MakeRequest(http::verb method, const std::string &target,
                                const std::string &body = "") {
    ControlApi::Request req(method, target, 11);
    if (!body.empty()) {
        req.set(http::field::content_type, "application/json");
        req.body() = body;
        req.prepare_payload();
    }
    return req;
}

json Body(const ControlApi::Response &res) { return json::parse(res.body()); }

void TestRouting(std::shared_ptr<ControlApi> api) {
    auto res = api->Handle(MakeRequest(http::verb::get, "/api/status"));
    assert(res.result() == http::status::ok);
    assert(res[http::field::access_control_allow_origin] == "*");
    assert(Body(res).contains("status_line"));

    res = api->Handle(MakeRequest(http::verb::get, "/api/status/?verbose=1"));
    assert(res.result() == http::status::ok);

    res = api->Handle(MakeRequest(http::verb::post, "/api/status"));
    assert(res.result() == http::status::method_not_allowed);

    res = api->Handle(MakeRequest(http::verb::get, "/api/unknown"));
    assert(res.result() == http::status::not_found);

    res = api->Handle(MakeRequest(http::verb::options, "/api/parameters"));
    assert(res.result() == http::status::no_content);
    assert(res[http::field::access_control_allow_origin] == "*");
    assert(res.find(http::field::access_control_allow_methods) != res.end());

    assert(ControlApi::TargetPath("/api/recording/?x=1") == "/api/recording");
    assert(ControlApi::TargetPath("/") == "/");
}

void TestParameters(std::shared_ptr<ControlApi> api) {
    auto res = api->Handle(MakeRequest(http::verb::get, "/api/parameters"));
    assert(res.result() == http::status::ok);
    assert(Body(res)["fps"] == 30);

    res = api->Handle(MakeRequest(http::verb::patch, "/api/parameters", R"({"fps": 20)"));
    assert(res.result() == http::status::bad_request);

    res = api->Handle(MakeRequest(http::verb::patch, "/api/parameters", R"({"fps": 200})"));
    assert(res.result() == http::status::unprocessable_entity);
    assert(Body(res)["field"] == "fps");

    res = api->Handle(MakeRequest(http::verb::patch, "/api/parameters", R"({"zoom": 2})"));
    assert(res.result() == http::status::unprocessable_entity);

    res = api->Handle(
        MakeRequest(http::verb::patch, "/api/parameters", R"({"fps": 20, "show_disparity": false})"));
    assert(res.result() == http::status::ok);
    assert(Body(res)["fps"] == 20 && Body(res)["show_disparity"] == false);

    res = api->Handle(MakeRequest(http::verb::delete_, "/api/parameters"));
    assert(res.result() == http::status::method_not_allowed);
}

void TestPreviewAndRecording(std::shared_ptr<ControlApi> api, const fs::path &dir) {
    auto res = api->Handle(MakeRequest(http::verb::get, "/api/preview/frame"));
    assert(res.result() == http::status::not_found);

    res = api->Handle(MakeRequest(http::verb::post, "/api/recording/start"));
    assert(res.result() == http::status::conflict);

    res = api->Handle(MakeRequest(http::verb::get, "/api/recording"));
    assert(res.result() == http::status::ok && Body(res)["status"] == "idle");

    res = api->Handle(MakeRequest(http::verb::post, "/api/preview/start"));
    assert(res.result() == http::status::ok && Body(res)["previewing"] == true);

    bool has_frame = false;
    for (int i = 0; i < 300 && !has_frame; i++) {
        res = api->Handle(MakeRequest(http::verb::get, "/api/preview/frame"));
        has_frame = res.result() == http::status::ok;
        if (!has_frame) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }
    assert(has_frame);
    assert(res[http::field::content_type] == "image/jpeg");
    assert(res.body().size() > 4 && static_cast<uint8_t>(res.body()[0]) == 0xFF &&
           static_cast<uint8_t>(res.body()[1]) == 0xD8);

    res = api->Handle(MakeRequest(http::verb::post, "/api/snapshot"));
    assert(res.result() == http::status::created);
    assert(fs::exists(Body(res)["path"].get<std::string>()));

    res = api->Handle(MakeRequest(http::verb::post, "/api/recording/start", R"({"out_dir": 7})"));
    assert(res.result() == http::status::unprocessable_entity);

    auto out_dir = (dir / "sessions").string();
    res = api->Handle(MakeRequest(http::verb::post, "/api/recording/start",
                                  json({{"out_dir", out_dir}}).dump()));
    assert(res.result() == http::status::created);
    auto session = Body(res);
    assert(session["status"] == "recording");
    assert(session["output_path"].get<std::string>().rfind(out_dir, 0) == 0);

    res = api->Handle(MakeRequest(http::verb::post, "/api/recording/start"));
    assert(res.result() == http::status::conflict);

    res = api->Handle(MakeRequest(http::verb::patch, "/api/parameters",
                                  R"({"resolution": "1280x720"})"));
    assert(res.result() == http::status::conflict);
    assert(Body(res)["field"] == "resolution");

    std::this_thread::sleep_for(std::chrono::milliseconds(500));

    res = api->Handle(MakeRequest(http::verb::get, "/api/recording"));
    assert(Body(res)["id"] == session["id"]);

    res = api->Handle(MakeRequest(http::verb::post, "/api/recording/stop"));
    assert(res.result() == http::status::ok);
    assert(Body(res)["status"] == "stopped");
    assert(Body(res)["frames_written"].get<uint64_t>() > 0);

    res = api->Handle(MakeRequest(http::verb::post, "/api/preview/stop"));
    assert(res.result() == http::status::ok && Body(res)["previewing"] == false);
}

int main(int argc, char *argv[]) {
    auto dir = fs::temp_directory_path() / ("stereo_rig_api_" + std::to_string(getpid()));
    fs::create_directories(dir);

    Args args;
    args.source = "fake";
    args.width = 640;
    args.height = 480;
    args.record_path = dir.string() + "/";
    args.min_free_mb = 1;
    args.stats_interval_ms = 200;

    auto coordinator = Coordinator::Create(args);
    auto api = ControlApi::Create(coordinator);

    TestRouting(api);
    TestParameters(api);
    TestPreviewAndRecording(api, dir);

    coordinator->Shutdown();
    fs::remove_all(dir);
    std::cout << "test_control_api passed" << std::endl;
    return 0;
}
