#ifndef TOGGL_CLIENT_HPP
#define TOGGL_CLIENT_HPP

#include "types.hpp"
#include "errors.hpp"
#include "json.hpp"
#include "resources.hpp"
#include "transport.hpp"

#include <string>
#include <memory>

namespace toggl {

/**
 * Toggl SDK Client - C++ interface for Toggl's REST API.
 *
 * Requests name a resource registered in a Resources registry; the client
 * resolves it, authenticates with Basic Auth and maps both success and
 * failure bodies.
 *
 * Core methods:
 *   - getRequest()    - GET, optionally decoding the payload
 *   - postRequest()   - POST a JSON body
 *   - putRequest()    - PUT a JSON body
 *   - deleteRequest() - DELETE
 *   - buildRequest() / request() - the lower-level pipeline
 *
 * Example:
 *   toggl::Resources resources;
 *   toggl::register_default_endpoints(resources);
 *
 *   toggl::Config cfg;
 *   cfg.api_token = "1971800d4d82861d8f2c1651fea4d212";
 *   toggl::Client client(cfg, resources);
 *
 *   toggl::JsonValue workspaces;
 *   client.getRequest("workspaces", workspaces);
 *
 * Every failure is thrown as a TogglError subclass; the first failing stage
 * (resolution, build, transport, decode) wins.
 */
class Client {
public:
    /**
     * Construct a Toggl client.
     *
     * The registry is not owned and must outlive the client. If config.api_token
     * is empty, reads from TOGGL_API_TOKEN env var. If transport is null a
     * CurlTransport with config.timeout_ms is used.
     *
     * @throws TogglError if no API token is available.
     */
    Client(const Config& config, Resources& resources,
           std::shared_ptr<Transport> transport = std::shared_ptr<Transport>());

    ~Client();

    // Non-copyable, movable
    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;
    Client(Client&& other);
    Client& operator=(Client&& other);

    const Credential& credential() const;
    const std::string& user_agent() const;
    const std::string& content_type() const;

    // =========================================================================
    // Request pipeline
    // =========================================================================

    /**
     * Build an authenticated request for a registered resource.
     *
     * @throws UnknownResourceError if the resource is not registered.
     * @throws InvalidRequestError if its URL is malformed.
     */
    HttpRequest buildRequest(HttpMethod method, const std::string& resource) const;

    /** Same, with a JSON body. */
    HttpRequest buildRequest(HttpMethod method, const std::string& resource,
                             const JsonValue& body) const;

    /**
     * Execute a built request and decode the response into *out
     * (pass NULL when no payload is expected).
     *
     * @throws NetworkError / TimeoutError on transport failure.
     * @throws DecodeError if a 200 body is not valid JSON.
     * @throws ApiError for any non-200 status.
     */
    void request(const HttpRequest& req, JsonValue* out) const;

    // =========================================================================
    // Convenience verbs
    // =========================================================================

    /** GET a resource; the payload is not read. */
    void getRequest(const std::string& resource) const;

    /** GET a resource and decode the payload into out. */
    void getRequest(const std::string& resource, JsonValue& out) const;

    void postRequest(const std::string& resource, const JsonValue& body,
                     JsonValue* out = NULL) const;

    void putRequest(const std::string& resource, const JsonValue& body,
                    JsonValue* out = NULL) const;

    void deleteRequest(const std::string& resource, JsonValue* out = NULL) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace toggl

#endif // TOGGL_CLIENT_HPP
