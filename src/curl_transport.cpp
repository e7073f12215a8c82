#include "toggl/transport.hpp"
#include "toggl/errors.hpp"

#include <curl/curl.h>

#include <string>

namespace toggl {

// =============================================================================
// CURL callbacks
// =============================================================================

static size_t curl_write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    std::string* buf = static_cast<std::string*>(userdata);
    size_t total = size * nmemb;
    buf->append(ptr, total);
    return total;
}

/**
 * Keep the last status line seen. Redirects and 100-continue produce
 * several; the final one wins.
 */
static size_t curl_header_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    std::string* status = static_cast<std::string*>(userdata);
    size_t total = size * nmemb;
    std::string line(ptr, total);

    if (line.compare(0, 5, "HTTP/") == 0) {
        *status = parse_status_line(line);
    }
    return total;
}

/* curl_global_init is not thread-safe; run it once before any handle exists. */
struct CurlGlobal {
    CurlGlobal() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobal() { curl_global_cleanup(); }
};

static void ensure_curl_global() {
    static CurlGlobal global;
    (void)global;
}

const char* custom_request_verb(const HttpRequest& request) {
    switch (request.method) {
        case HTTP_GET:
            /* POSTFIELDS would otherwise turn it into a POST */
            return request.has_body ? "GET" : NULL;
        case HTTP_POST:
            return NULL;
        case HTTP_PUT:
        case HTTP_DELETE:
            return http_method_to_string(request.method);
    }
    return NULL;
}

// =============================================================================
// CurlTransport
// =============================================================================

CurlTransport::CurlTransport(int timeout_ms)
    : timeout_ms_(timeout_ms > 0 ? timeout_ms : DEFAULT_TIMEOUT_MS)
{
    ensure_curl_global();
}

HttpResponse CurlTransport::perform(const HttpRequest& request) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw NetworkError("Failed to initialize CURL");
    }

    HttpResponse response;
    long http_code = 0;

    struct curl_slist* headers = NULL;
    for (Headers::const_iterator it = request.headers.begin(); it != request.headers.end(); ++it) {
        std::string line = it->first + ": " + it->second;
        headers = curl_slist_append(headers, line.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curl_write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, curl_header_cb);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.status);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    if (!request.username.empty() || !request.password.empty()) {
        curl_easy_setopt(curl, CURLOPT_HTTPAUTH, static_cast<long>(CURLAUTH_BASIC));
        curl_easy_setopt(curl, CURLOPT_USERNAME, request.username.c_str());
        curl_easy_setopt(curl, CURLOPT_PASSWORD, request.password.c_str());
    }

    const char* verb = custom_request_verb(request);
    if (verb) {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, verb);
    } else if (request.method == HTTP_POST) {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
    } else {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    }

    if (request.has_body) {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    } else if (request.method == HTTP_POST) {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, "");
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, 0L);
    }

    CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res == CURLE_OPERATION_TIMEDOUT) {
        throw TimeoutError("Request timed out");
    }
    if (res == CURLE_URL_MALFORMAT) {
        throw InvalidRequestError(std::string("CURL error: ") + curl_easy_strerror(res));
    }
    if (res != CURLE_OK) {
        throw NetworkError(std::string("CURL error: ") + curl_easy_strerror(res));
    }

    response.status_code = static_cast<int>(http_code);

    /* HTTP/2 carries no reason phrase */
    response.status = complete_status(response.status, response.status_code);
    return response;
}

} /* namespace toggl */
