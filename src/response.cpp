#include "toggl/response.hpp"

#include <climits>

namespace toggl {

ErrorEnvelope parse_error_envelope(const std::string& body) {
    ErrorEnvelope envelope;

    JsonValue parsed;
    if (!decode_json(body, parsed) || !parsed.is<JsonObject>()) {
        return envelope;
    }

    const JsonObject& root = parsed.get<JsonObject>();
    JsonObject::const_iterator err_it = root.find("error");
    if (err_it == root.end() || !err_it->second.is<JsonObject>()) {
        return envelope;
    }

    const JsonObject& err = err_it->second.get<JsonObject>();
    JsonObject::const_iterator code_it = err.find("code");
    if (code_it == err.end() || !code_it->second.is<double>()) {
        return envelope;
    }
    double code = code_it->second.get<double>();
    if (!(code >= static_cast<double>(INT_MIN) && code <= static_cast<double>(INT_MAX))) {
        return envelope;
    }

    JsonObject::const_iterator msg_it = err.find("message");
    if (msg_it != err.end()) {
        if (!msg_it->second.is<std::string>()) {
            return envelope;
        }
        envelope.message = msg_it->second.get<std::string>();
    }

    envelope.code = static_cast<int>(code);
    envelope.found = true;
    return envelope;
}

ApiError api_error_from_response(const HttpResponse& response) {
    ErrorEnvelope envelope = parse_error_envelope(response.body);
    if (envelope.found) {
        return ApiError(envelope.code, envelope.message);
    }

    /* No usable envelope: fall back to the raw status */
    std::string status = complete_status(response.status, response.status_code);
    return ApiError(response.status_code, status);
}

void decode_response(const HttpResponse& response, JsonValue* out) {
    if (response.status_code != 200) {
        throw api_error_from_response(response);
    }

    if (!out) {
        return;
    }

    std::string parse_err;
    if (!decode_json(response.body, *out, &parse_err)) {
        throw DecodeError(std::string("Failed to parse API response: ") + parse_err,
                          response.status_code);
    }
}

} /* namespace toggl */
