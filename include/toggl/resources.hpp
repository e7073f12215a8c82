#ifndef TOGGL_RESOURCES_HPP
#define TOGGL_RESOURCES_HPP

#include "endpoint.hpp"
#include "errors.hpp"

#include <map>
#include <string>

namespace toggl {

/**
 * Registry of named resources.
 *
 * Populate it before handing it to a Client. Names are unique; there is no
 * removal. Concurrent reads are safe, mutation must be synchronized by the
 * caller.
 */
class Resources {
public:
    /**
     * Register an endpoint under a name.
     *
     * @throws DuplicateResourceError if the name is taken. The existing
     *         registration is left untouched.
     */
    void addEndpoint(const std::string& name, const Endpoint& endpoint);

    /**
     * Resolve a name to a copy of its endpoint's URL.
     *
     * @throws UnknownResourceError if the name was never registered.
     */
    Url getURL(const std::string& name) const;

    bool contains(const std::string& name) const;

    size_t size() const { return endpoints_.size(); }

private:
    std::map<std::string, Endpoint> endpoints_;
};

/**
 * Register the six Toggl service endpoints under their kind names
 * ("workspaces", "clients", "report_weekly", "report_detailed",
 * "report_summary", "start_time_entry").
 *
 * @throws DuplicateResourceError if any of those names is already taken.
 */
void register_default_endpoints(Resources& resources);

} // namespace toggl

#endif // TOGGL_RESOURCES_HPP
