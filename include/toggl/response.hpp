#ifndef TOGGL_RESPONSE_HPP
#define TOGGL_RESPONSE_HPP

#include "types.hpp"
#include "json.hpp"
#include "errors.hpp"

#include <string>

namespace toggl {

/**
 * Outcome of reading a non-200 body as the service's error envelope
 * {"error": {"code": <int>, "message": <string>}}.
 */
struct ErrorEnvelope {
    bool found;
    int code;
    std::string message;

    ErrorEnvelope()
        : found(false)
        , code(0)
    {}
};

/**
 * Try to read the error envelope from a response body. Never throws;
 * found is false when the body is not JSON or lacks the envelope.
 */
ErrorEnvelope parse_error_envelope(const std::string& body);

/**
 * Map a failed response to an ApiError: the envelope's code and message
 * when present, otherwise the raw status code and status line.
 */
ApiError api_error_from_response(const HttpResponse& response);

/**
 * Decode a completed response.
 *
 * Status 200 decodes the body into *out. When out is NULL no payload is
 * expected and the body is not read.
 *
 * @throws DecodeError if a 200 body is not valid JSON.
 * @throws ApiError for any other status.
 */
void decode_response(const HttpResponse& response, JsonValue* out);

} // namespace toggl

#endif // TOGGL_RESPONSE_HPP
