#ifndef TOGGL_HPP
#define TOGGL_HPP

/**
 * Toggl C++ SDK - client library for the Toggl time-tracking REST API.
 *
 * Include this single header to get the full SDK:
 *
 *   #include <toggl/toggl.hpp>
 *
 *   int main() {
 *       toggl::Resources resources;
 *       toggl::register_default_endpoints(resources);
 *       resources.addEndpoint("me", toggl::Endpoint::custom(
 *           "https://www.toggl.com/api/v8/me"));
 *
 *       toggl::Config cfg;
 *       cfg.api_token = "1971800d4d82861d8f2c1651fea4d212";
 *       toggl::Client client(cfg, resources);
 *
 *       // Check the token without reading the payload
 *       client.getRequest("me");
 *
 *       // List workspaces
 *       toggl::JsonValue workspaces;
 *       client.getRequest("workspaces", workspaces);
 *
 *       // Start a time entry
 *       toggl::JsonObject entry;
 *       entry["description"] = toggl::JsonValue(std::string("Meeting"));
 *       entry["created_with"] = toggl::JsonValue(std::string("toggl-cpp"));
 *       toggl::JsonObject body;
 *       body["time_entry"] = toggl::JsonValue(entry);
 *       client.postRequest("start_time_entry", toggl::JsonValue(body));
 *   }
 *
 * Dependencies:
 *   - libcurl (linked at build time)
 *   - picojson (header-only)
 *
 * Minimum C++ standard: C++11
 */

#include "types.hpp"
#include "errors.hpp"
#include "json.hpp"
#include "endpoint.hpp"
#include "resources.hpp"
#include "transport.hpp"
#include "response.hpp"
#include "client.hpp"

/**
 * Version information
 */
#define TOGGL_SDK_VERSION_MAJOR 0
#define TOGGL_SDK_VERSION_MINOR 1
#define TOGGL_SDK_VERSION_PATCH 0
#define TOGGL_SDK_VERSION "0.1.0"

#endif // TOGGL_HPP
