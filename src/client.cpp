#include "toggl/client.hpp"
#include "toggl/response.hpp"
#include "toggl/toggl.hpp"

#include <cstdlib>

namespace toggl {

// =============================================================================
// Helpers
// =============================================================================

static const char* DEFAULT_USER_AGENT = "toggl-cpp/" TOGGL_SDK_VERSION;

/**
 * Get environment variable or fallback.
 */
static std::string env_or(const char* name, const std::string& fallback) {
    const char* val = std::getenv(name);
    if (val && val[0] != '\0') {
        return std::string(val);
    }
    return fallback;
}

static Credential resolve_credential(const Config& config) {
    std::string token = config.api_token;
    if (token.empty()) {
        token = env_or("TOGGL_API_TOKEN", "");
    }
    if (token.empty()) {
        throw TogglError(
            "Toggl API token is required. Either pass config.api_token or set TOGGL_API_TOKEN.",
            0, "NO_API_TOKEN"
        );
    }

    std::string secret = config.api_secret;
    if (secret.empty()) {
        secret = env_or("TOGGL_API_SECRET", API_SECRET);
    }
    return Credential(token, secret);
}

// =============================================================================
// Client::Impl (PIMPL)
// =============================================================================

struct Client::Impl {
    Resources* resources;
    Credential credential;
    std::string content_type;
    std::string user_agent;
    std::shared_ptr<Transport> transport;

    Impl(const Config& config, Resources& res, std::shared_ptr<Transport> tr)
        : resources(&res)
        , credential(resolve_credential(config))
        , content_type(CONTENT_TYPE_JSON)
        , user_agent(config.user_agent.empty() ? std::string(DEFAULT_USER_AGENT)
                                               : config.user_agent)
        , transport(tr)
    {
        if (!transport) {
            transport = std::make_shared<CurlTransport>(config.timeout_ms);
        }
    }

    HttpRequest build(HttpMethod method, const std::string& resource,
                      const std::string* body) const {
        /* Resolution errors propagate unchanged */
        Url url = resources->getURL(resource);

        HttpRequest req;
        req.method = method;
        req.url = url.str();
        if (body) {
            req.body = *body;
            req.has_body = true;
        }

        req.username = credential.token();
        req.password = credential.secret();
        req.headers.push_back(std::make_pair(std::string("User-Agent"), user_agent));
        req.headers.push_back(std::make_pair(std::string("Content-Type"), content_type));
        return req;
    }

    void execute(const HttpRequest& req, JsonValue* out) const {
        /* Transport errors propagate before any body is inspected */
        HttpResponse resp = transport->perform(req);
        decode_response(resp, out);
    }
};

// =============================================================================
// Client construction / destruction
// =============================================================================

Client::Client(const Config& config, Resources& resources,
               std::shared_ptr<Transport> transport)
    : impl_(new Impl(config, resources, transport))
{}

Client::~Client() {}

Client::Client(Client&& other) = default;
Client& Client::operator=(Client&& other) = default;

const Credential& Client::credential() const {
    return impl_->credential;
}

const std::string& Client::user_agent() const {
    return impl_->user_agent;
}

const std::string& Client::content_type() const {
    return impl_->content_type;
}

// =============================================================================
// Request pipeline
// =============================================================================

HttpRequest Client::buildRequest(HttpMethod method, const std::string& resource) const {
    return impl_->build(method, resource, NULL);
}

HttpRequest Client::buildRequest(HttpMethod method, const std::string& resource,
                                 const JsonValue& body) const {
    std::string encoded = encode_json(body);
    return impl_->build(method, resource, &encoded);
}

void Client::request(const HttpRequest& req, JsonValue* out) const {
    impl_->execute(req, out);
}

// =============================================================================
// Convenience verbs
// =============================================================================

void Client::getRequest(const std::string& resource) const {
    impl_->execute(buildRequest(HTTP_GET, resource), NULL);
}

void Client::getRequest(const std::string& resource, JsonValue& out) const {
    impl_->execute(buildRequest(HTTP_GET, resource), &out);
}

void Client::postRequest(const std::string& resource, const JsonValue& body,
                         JsonValue* out) const {
    impl_->execute(buildRequest(HTTP_POST, resource, body), out);
}

void Client::putRequest(const std::string& resource, const JsonValue& body,
                        JsonValue* out) const {
    impl_->execute(buildRequest(HTTP_PUT, resource, body), out);
}

void Client::deleteRequest(const std::string& resource, JsonValue* out) const {
    impl_->execute(buildRequest(HTTP_DELETE, resource), out);
}

} /* namespace toggl */
