#ifndef API_JSON_H_
#define API_JSON_H_

#include <nlohmann/json.hpp>

#include "params/parameter_set.h"
#include "recorder/recording_session.h"
#include "status/status_aggregator.h"

using json = nlohmann::json;

class ApiJson {
  public:
    static json ToJson(const ParameterSet &params);
    static json ToJson(const RecordingSession &session);
    static json ToJson(const StatusSnapshot &snapshot);
    static json ErrorBody(const std::string &message, const std::string &field = "");

    // Throws ParameterError for unknown fields or values of the wrong type.
    // `resolution` may be given as "WxH" instead of width and height.
    static ParameterPatch ParsePatch(const json &body);
};

#endif // API_JSON_H_
