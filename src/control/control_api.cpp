#include "control/control_api.h"

#include "common/errors.h"
#include "common/logging.h"

namespace {

std::string MethodName(const ControlApi::Request &req) {
    auto name = req.method_string();
    return std::string(name.data(), name.size());
}

} // namespace

std::shared_ptr<ControlApi> ControlApi::Create(std::shared_ptr<Coordinator> coordinator) {
    return std::make_shared<ControlApi>(coordinator);
}

ControlApi::ControlApi(std::shared_ptr<Coordinator> coordinator)
    : coordinator_(coordinator) {}

std::string ControlApi::TargetPath(beast::string_view target) {
    std::string path(target.data(), target.size());
    auto query = path.find('?');
    if (query != std::string::npos) {
        path.erase(query);
    }
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

ControlApi::Response ControlApi::Handle(const Request &req) {
    auto path = TargetPath(req.target());
    DEBUG_PRINT("%s %s", MethodName(req).c_str(), path.c_str());

    if (req.method() == http::verb::options) {
        return OptionsResponse(req);
    }

    try {
        return Route(req, path);
    } catch (const ParameterError &e) {
        auto status = e.reason() == ParameterError::Reason::LOCKED
                          ? http::status::conflict
                          : http::status::unprocessable_entity;
        return JsonResponse(req, status, ApiJson::ErrorBody(e.what(), e.field()));
    } catch (const RecordingError &e) {
        return JsonResponse(req, http::status::conflict, ApiJson::ErrorBody(e.what()));
    } catch (const CaptureError &e) {
        return JsonResponse(req, http::status::service_unavailable, ApiJson::ErrorBody(e.what()));
    } catch (const json::exception &e) {
        return JsonResponse(req, http::status::bad_request,
                            ApiJson::ErrorBody(std::string("malformed JSON: ") + e.what()));
    } catch (const std::exception &e) {
        ERROR_PRINT("%s %s failed: %s", MethodName(req).c_str(), path.c_str(),
                    e.what());
        return JsonResponse(req, http::status::internal_server_error,
                            ApiJson::ErrorBody(e.what()));
    }
}

ControlApi::Response ControlApi::Route(const Request &req, const std::string &path) {
    auto method = req.method();

    if (path == "/api/status") {
        if (method != http::verb::get) {
            return MethodNotAllowed(req, "GET, OPTIONS");
        }
        return JsonResponse(req, http::status::ok, ApiJson::ToJson(coordinator_->Status()));
    } else if (path == "/api/parameters") {
        return HandleParameters(req);
    } else if (path == "/api/preview/start") {
        if (method != http::verb::post) {
            return MethodNotAllowed(req, "POST, OPTIONS");
        }
        coordinator_->StartPreview();
        return JsonResponse(req, http::status::ok, {{"previewing", true}});
    } else if (path == "/api/preview/stop") {
        if (method != http::verb::post) {
            return MethodNotAllowed(req, "POST, OPTIONS");
        }
        coordinator_->StopPreview();
        return JsonResponse(req, http::status::ok, {{"previewing", false}});
    } else if (path == "/api/preview/frame") {
        if (method != http::verb::get) {
            return MethodNotAllowed(req, "GET, OPTIONS");
        }
        auto jpeg = coordinator_->LatestPreviewJpeg();
        if (!jpeg || jpeg->length == 0) {
            return JsonResponse(req, http::status::not_found,
                                ApiJson::ErrorBody("no preview frame available"));
        }
        Response res(http::status::ok, req.version());
        SetCommonHeader(res);
        res.set(http::field::content_type, "image/jpeg");
        res.set(http::field::cache_control, "no-store");
        res.body().assign(reinterpret_cast<const char *>(jpeg->start.get()), jpeg->length);
        res.prepare_payload();
        return res;
    } else if (path == "/api/recording/start") {
        if (method != http::verb::post) {
            return MethodNotAllowed(req, "POST, OPTIONS");
        }
        return HandleRecordingStart(req);
    } else if (path == "/api/recording/stop") {
        if (method != http::verb::post) {
            return MethodNotAllowed(req, "POST, OPTIONS");
        }
        return SessionResponse(req, coordinator_->StopRecording());
    } else if (path == "/api/recording") {
        if (method != http::verb::get) {
            return MethodNotAllowed(req, "GET, OPTIONS");
        }
        return SessionResponse(req, coordinator_->Recording());
    } else if (path == "/api/snapshot") {
        if (method != http::verb::post) {
            return MethodNotAllowed(req, "POST, OPTIONS");
        }
        return JsonResponse(req, http::status::created, {{"path", coordinator_->Snapshot()}});
    }

    return JsonResponse(req, http::status::not_found, ApiJson::ErrorBody("no route for " + path));
}

ControlApi::Response ControlApi::HandleParameters(const Request &req) {
    if (req.method() == http::verb::get) {
        return JsonResponse(req, http::status::ok, ApiJson::ToJson(coordinator_->Parameters()));
    } else if (req.method() == http::verb::patch) {
        auto patch = ApiJson::ParsePatch(json::parse(req.body()));
        return JsonResponse(req, http::status::ok,
                            ApiJson::ToJson(coordinator_->UpdateParameters(patch)));
    }
    return MethodNotAllowed(req, "GET, PATCH, OPTIONS");
}

ControlApi::Response ControlApi::HandleRecordingStart(const Request &req) {
    std::string out_dir;
    if (!req.body().empty()) {
        auto body = json::parse(req.body());
        if (!body.is_object()) {
            return JsonResponse(req, http::status::bad_request,
                                ApiJson::ErrorBody("body must be a JSON object"));
        }
        if (body.contains("out_dir")) {
            if (!body["out_dir"].is_string()) {
                throw ParameterError("out_dir", "must be a string");
            }
            out_dir = body["out_dir"].get<std::string>();
        }
    }

    auto session = coordinator_->StartRecording(out_dir);
    return JsonResponse(req, http::status::created, ApiJson::ToJson(session));
}

ControlApi::Response ControlApi::SessionResponse(const Request &req,
                                                 const std::optional<RecordingSession> &session) {
    if (!session) {
        return JsonResponse(req, http::status::ok, {{"status", ToString(SessionStatus::IDLE)}});
    }
    return JsonResponse(req, http::status::ok, ApiJson::ToJson(*session));
}

ControlApi::Response ControlApi::JsonResponse(const Request &req, http::status status,
                                              const json &body) {
    Response res(status, req.version());
    SetCommonHeader(res);
    res.set(http::field::content_type, "application/json");
    res.body() = body.dump();
    res.prepare_payload();
    return res;
}

ControlApi::Response ControlApi::OptionsResponse(const Request &req) {
    Response res(http::status::no_content, req.version());
    SetCommonHeader(res);
    res.set(http::field::access_control_allow_headers,
            "Origin, X-Requested-With, Content-Type, Accept, Authorization");
    res.set(http::field::access_control_allow_methods, "GET, OPTIONS, PATCH, POST");
    res.prepare_payload();
    return res;
}

ControlApi::Response ControlApi::MethodNotAllowed(const Request &req, const char *allowed) {
    Response res = JsonResponse(req, http::status::method_not_allowed,
                                ApiJson::ErrorBody("method not allowed"));
    res.set(http::field::allow, allowed);
    return res;
}

void ControlApi::SetCommonHeader(Response &res) {
    res.set(http::field::server, "stereo-rig");
    res.set(http::field::access_control_allow_origin, "*");
}
