#ifndef CONTROL_API_H_
#define CONTROL_API_H_

#include <memory>
#include <string>

#include <boost/beast/http.hpp>

#include "control/api_json.h"
#include "coordinator.h"

namespace beast = boost::beast;
namespace http = beast::http;

/*
 * Maps control requests onto the Coordinator. Independent of the transport so
 * it can be driven directly with beast request objects.
 */
class ControlApi {
  public:
    using Request = http::request<http::string_body>;
    using Response = http::response<http::string_body>;

    static std::shared_ptr<ControlApi> Create(std::shared_ptr<Coordinator> coordinator);

    ControlApi(std::shared_ptr<Coordinator> coordinator);

    Response Handle(const Request &req);

    static std::string TargetPath(beast::string_view target);

  private:
    std::shared_ptr<Coordinator> coordinator_;

    Response Route(const Request &req, const std::string &path);
    Response HandleParameters(const Request &req);
    Response HandleRecordingStart(const Request &req);
    Response SessionResponse(const Request &req, const std::optional<RecordingSession> &session);

    static Response JsonResponse(const Request &req, http::status status, const json &body);
    static Response OptionsResponse(const Request &req);
    static Response MethodNotAllowed(const Request &req, const char *allowed);
    static void SetCommonHeader(Response &res);
};

#endif // CONTROL_API_H_
