#ifndef TOGGL_TYPES_HPP
#define TOGGL_TYPES_HPP

#include <string>
#include <vector>
#include <utility>

namespace toggl {

// =============================================================================
// Constants
// =============================================================================

/** Password half of the Basic Auth pair, as specified by Toggl. */
static const char* const API_SECRET = "api_token";

static const char* const CONTENT_TYPE_JSON = "application/json";

static const int DEFAULT_TIMEOUT_MS = 30000;

// =============================================================================
// Configuration
// =============================================================================

/**
 * Configuration for the Toggl SDK client.
 *
 * api_token:  Your Toggl API token.
 *             Falls back to TOGGL_API_TOKEN environment variable.
 * api_secret: Basic Auth password. Falls back to TOGGL_API_SECRET,
 *             then to the literal "api_token" the service expects.
 * user_agent: Defaults to "toggl-cpp/<version>".
 * timeout_ms: Request timeout in milliseconds. Default: 30000.
 */
struct Config {
    std::string api_token;
    std::string api_secret;
    std::string user_agent;
    int timeout_ms;

    Config()
        : api_token("")
        , api_secret("")
        , user_agent("")
        , timeout_ms(DEFAULT_TIMEOUT_MS)
    {}
};

// =============================================================================
// Credential
// =============================================================================

/**
 * Token/secret pair sent as Basic Auth username/password on every request.
 */
class Credential {
public:
    Credential(const std::string& token, const std::string& secret)
        : token_(token)
        , secret_(secret)
    {}

    const std::string& token() const { return token_; }
    const std::string& secret() const { return secret_; }

private:
    std::string token_;
    std::string secret_;
};

// =============================================================================
// HTTP
// =============================================================================

enum HttpMethod {
    HTTP_GET,
    HTTP_POST,
    HTTP_PUT,
    HTTP_DELETE
};

inline const char* http_method_to_string(HttpMethod m) {
    switch (m) {
        case HTTP_GET:    return "GET";
        case HTTP_POST:   return "POST";
        case HTTP_PUT:    return "PUT";
        case HTTP_DELETE: return "DELETE";
        default:          return "UNKNOWN";
    }
}

/** Header list in insertion order. Names are sent as given. */
typedef std::vector<std::pair<std::string, std::string> > Headers;

/**
 * Look up a header by name (case-insensitive). Returns "" when absent.
 */
std::string find_header(const Headers& headers, const std::string& name);

struct HttpRequest {
    HttpMethod method;
    std::string url;
    Headers headers;
    std::string body;
    bool has_body;
    std::string username;   // Basic Auth, applied by the transport
    std::string password;

    HttpRequest()
        : method(HTTP_GET)
        , has_body(false)
    {}
};

struct HttpResponse {
    int status_code;
    std::string status;   // Status line text, e.g. "404 Not Found"
    std::string body;

    HttpResponse()
        : status_code(0)
    {}
};

/**
 * Standard reason phrase for an HTTP status code ("" if unknown).
 */
const char* http_reason_phrase(int status_code);

/**
 * Text after the protocol of a raw status line, trailing CR/LF/space removed:
 * "HTTP/1.1 404 Not Found\r\n" -> "404 Not Found", "HTTP/2 502 \r\n" -> "502".
 * Returns "" if the line is not a status line.
 */
std::string parse_status_line(const std::string& line);

/**
 * Complete a status text for display: an empty status becomes the code, and
 * a status without reason phrase (HTTP/2) gets the standard one appended.
 */
std::string complete_status(const std::string& status, int status_code);

} // namespace toggl

#endif // TOGGL_TYPES_HPP
