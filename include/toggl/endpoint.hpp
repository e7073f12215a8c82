#ifndef TOGGL_ENDPOINT_HPP
#define TOGGL_ENDPOINT_HPP

#include <string>

namespace toggl {

// =============================================================================
// Fixed service URLs
// =============================================================================

static const char* const ENDPOINT_WORKSPACES      = "https://www.toggl.com/api/v8/workspaces";
static const char* const ENDPOINT_CLIENTS         = "https://www.toggl.com/api/v8/clients";
static const char* const ENDPOINT_REPORT_WEEKLY   = "https://toggl.com/reports/api/v2/weekly";
static const char* const ENDPOINT_REPORT_DETAILED = "https://toggl.com/reports/api/v2/details";
static const char* const ENDPOINT_REPORT_SUMMARY  = "https://toggl.com/reports/api/v2/summary";
static const char* const ENDPOINT_START_TIME      = "https://www.toggl.com/api/v8/time_entries/start";

// =============================================================================
// URL
// =============================================================================

/**
 * Absolute URL split into its parts. The fragment is not kept.
 */
struct Url {
    std::string scheme;   // "https"
    std::string host;     // "toggl.com" or "localhost:8080"
    std::string path;     // "/reports/api/v2/weekly", may be empty
    std::string query;    // without the leading '?'

    /** Reassemble as scheme://host/path?query */
    std::string str() const;
};

/**
 * Parse an absolute URL.
 *
 * @throws InvalidRequestError if the scheme or host is missing or malformed.
 */
Url parse_url(const std::string& text);

// =============================================================================
// Endpoint
// =============================================================================

enum EndpointKind {
    ENDPOINT_KIND_WORKSPACES,
    ENDPOINT_KIND_CLIENTS,
    ENDPOINT_KIND_REPORT_WEEKLY,
    ENDPOINT_KIND_REPORT_DETAILED,
    ENDPOINT_KIND_REPORT_SUMMARY,
    ENDPOINT_KIND_START_TIME_ENTRY,
    ENDPOINT_KIND_CUSTOM
};

inline const char* endpoint_kind_to_string(EndpointKind k) {
    switch (k) {
        case ENDPOINT_KIND_WORKSPACES:       return "workspaces";
        case ENDPOINT_KIND_CLIENTS:          return "clients";
        case ENDPOINT_KIND_REPORT_WEEKLY:    return "report_weekly";
        case ENDPOINT_KIND_REPORT_DETAILED:  return "report_detailed";
        case ENDPOINT_KIND_REPORT_SUMMARY:   return "report_summary";
        case ENDPOINT_KIND_START_TIME_ENTRY: return "start_time_entry";
        case ENDPOINT_KIND_CUSTOM:           return "custom";
        default:                             return "unknown";
    }
}

/**
 * A concrete REST endpoint. Immutable; the URL is fixed by its kind,
 * except for ENDPOINT_KIND_CUSTOM which carries its own.
 */
class Endpoint {
public:
    explicit Endpoint(EndpointKind kind);

    /** An endpoint at an arbitrary URL. */
    static Endpoint custom(const std::string& url);

    EndpointKind kind() const { return kind_; }

    std::string url_string() const;

    /** @throws InvalidRequestError if the URL does not parse. */
    Url url() const;

private:
    Endpoint(EndpointKind kind, const std::string& custom_url);

    EndpointKind kind_;
    std::string custom_url_;
};

} // namespace toggl

#endif // TOGGL_ENDPOINT_HPP
