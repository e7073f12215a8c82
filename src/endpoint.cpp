#include "toggl/endpoint.hpp"
#include "toggl/errors.hpp"

#include <cctype>

namespace toggl {

// =============================================================================
// URL parsing
// =============================================================================

static bool valid_scheme(const std::string& scheme) {
    if (scheme.empty() || !std::isalpha(static_cast<unsigned char>(scheme[0]))) {
        return false;
    }
    for (size_t i = 1; i < scheme.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(scheme[i]);
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') {
            return false;
        }
    }
    return true;
}

static bool valid_host(const std::string& host) {
    if (host.empty()) return false;
    for (size_t i = 0; i < host.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(host[i]);
        if (std::isspace(c) || std::iscntrl(c) || c == '\\') {
            return false;
        }
    }
    return true;
}

Url parse_url(const std::string& text) {
    size_t sep = text.find("://");
    if (sep == std::string::npos) {
        throw InvalidRequestError("Malformed URL (missing scheme): " + text);
    }

    Url url;
    url.scheme = text.substr(0, sep);
    if (!valid_scheme(url.scheme)) {
        throw InvalidRequestError("Malformed URL (bad scheme): " + text);
    }

    std::string rest = text.substr(sep + 3);

    /* Drop the fragment */
    size_t hash = rest.find('#');
    if (hash != std::string::npos) {
        rest.erase(hash);
    }

    size_t host_end = rest.find_first_of("/?");
    url.host = rest.substr(0, host_end);
    if (!valid_host(url.host)) {
        throw InvalidRequestError("Malformed URL (bad host): " + text);
    }

    if (host_end != std::string::npos) {
        std::string tail = rest.substr(host_end);
        size_t q = tail.find('?');
        url.path = tail.substr(0, q);
        if (q != std::string::npos) {
            url.query = tail.substr(q + 1);
        }
    }

    for (size_t i = 0; i < url.path.size(); ++i) {
        if (std::isspace(static_cast<unsigned char>(url.path[i]))) {
            throw InvalidRequestError("Malformed URL (whitespace in path): " + text);
        }
    }

    return url;
}

std::string Url::str() const {
    std::string out = scheme + "://" + host + path;
    if (!query.empty()) {
        out += "?" + query;
    }
    return out;
}

// =============================================================================
// Endpoint
// =============================================================================

Endpoint::Endpoint(EndpointKind kind)
    : kind_(kind)
{
    if (kind == ENDPOINT_KIND_CUSTOM) {
        throw InvalidRequestError("Custom endpoints need a URL; use Endpoint::custom()");
    }
}

Endpoint::Endpoint(EndpointKind kind, const std::string& custom_url)
    : kind_(kind)
    , custom_url_(custom_url)
{}

Endpoint Endpoint::custom(const std::string& url) {
    return Endpoint(ENDPOINT_KIND_CUSTOM, url);
}

std::string Endpoint::url_string() const {
    switch (kind_) {
        case ENDPOINT_KIND_WORKSPACES:       return ENDPOINT_WORKSPACES;
        case ENDPOINT_KIND_CLIENTS:          return ENDPOINT_CLIENTS;
        case ENDPOINT_KIND_REPORT_WEEKLY:    return ENDPOINT_REPORT_WEEKLY;
        case ENDPOINT_KIND_REPORT_DETAILED:  return ENDPOINT_REPORT_DETAILED;
        case ENDPOINT_KIND_REPORT_SUMMARY:   return ENDPOINT_REPORT_SUMMARY;
        case ENDPOINT_KIND_START_TIME_ENTRY: return ENDPOINT_START_TIME;
        case ENDPOINT_KIND_CUSTOM:           return custom_url_;
        default:                             return "";
    }
}

Url Endpoint::url() const {
    return parse_url(url_string());
}

} /* namespace toggl */
