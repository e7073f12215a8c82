#ifndef TOGGL_TRANSPORT_HPP
#define TOGGL_TRANSPORT_HPP

#include "types.hpp"

namespace toggl {

/**
 * Performs one HTTP exchange.
 *
 * Implementations must be safe to call from several threads at once.
 */
class Transport {
public:
    virtual ~Transport() {}

    /**
     * Send the request and return the response, whatever its status.
     *
     * @throws NetworkError on connection failure.
     * @throws TimeoutError if the request exceeds the timeout.
     */
    virtual HttpResponse perform(const HttpRequest& request) = 0;
};

/**
 * Verb CurlTransport passes as CURLOPT_CUSTOMREQUEST, or NULL when curl's
 * own GET/POST selection already matches the request.
 */
const char* custom_request_verb(const HttpRequest& request);

/**
 * libcurl-backed transport. One easy handle per request.
 */
class CurlTransport : public Transport {
public:
    explicit CurlTransport(int timeout_ms = DEFAULT_TIMEOUT_MS);

    HttpResponse perform(const HttpRequest& request);

    int timeout_ms() const { return timeout_ms_; }

private:
    int timeout_ms_;
};

} // namespace toggl

#endif // TOGGL_TRANSPORT_HPP
