#include "toggl/resources.hpp"

namespace toggl {

void Resources::addEndpoint(const std::string& name, const Endpoint& endpoint) {
    if (!endpoints_.insert(std::make_pair(name, endpoint)).second) {
        throw DuplicateResourceError(name);
    }
}

Url Resources::getURL(const std::string& name) const {
    std::map<std::string, Endpoint>::const_iterator it = endpoints_.find(name);
    if (it == endpoints_.end()) {
        throw UnknownResourceError(name);
    }
    return it->second.url();
}

bool Resources::contains(const std::string& name) const {
    return endpoints_.find(name) != endpoints_.end();
}

void register_default_endpoints(Resources& resources) {
    static const EndpointKind kinds[] = {
        ENDPOINT_KIND_WORKSPACES,
        ENDPOINT_KIND_CLIENTS,
        ENDPOINT_KIND_REPORT_WEEKLY,
        ENDPOINT_KIND_REPORT_DETAILED,
        ENDPOINT_KIND_REPORT_SUMMARY,
        ENDPOINT_KIND_START_TIME_ENTRY
    };
    for (size_t i = 0; i < sizeof(kinds) / sizeof(kinds[0]); ++i) {
        resources.addEndpoint(endpoint_kind_to_string(kinds[i]), Endpoint(kinds[i]));
    }
}

} /* namespace toggl */
