/**
 * Toggl C++ SDK - Start a Time Entry
 *
 * Demonstrates:
 *   1. Registering the service endpoints plus one of your own
 *   2. POSTing a JSON body and reading the payload
 *   3. Branching on service-level vs. infrastructure-level errors
 *
 * Build:
 *   cmake -B build -DTOGGL_BUILD_EXAMPLES=ON && cmake --build build
 *   ./build/toggl_start_time_entry "Writing docs"
 *
 * Set environment variables before running:
 *   export TOGGL_API_TOKEN="1971800d4d82861d8f2c1651fea4d212"
 */

#include <toggl/toggl.hpp>
#include <iostream>
#include <string>

int main(int argc, char** argv) {
    std::string description = argc > 1 ? argv[1] : "toggl-cpp example";

    try {
        // =====================================================================
        // Registry: service endpoints plus the current user
        // =====================================================================
        toggl::Resources resources;
        toggl::register_default_endpoints(resources);
        resources.addEndpoint("me", toggl::Endpoint::custom("https://www.toggl.com/api/v8/me"));

        toggl::Client client(toggl::Config(), resources);

        toggl::JsonValue me;
        client.getRequest("me", me);
        if (me.contains("data")) {
            std::cout << "Signed in as " << me.get("data").get("fullname").to_str() << std::endl;
        }

        // =====================================================================
        // Start the entry
        // =====================================================================
        toggl::JsonObject entry;
        entry["description"] = toggl::JsonValue(description);
        entry["created_with"] = toggl::JsonValue(std::string("toggl-cpp"));

        toggl::JsonObject body;
        body["time_entry"] = toggl::JsonValue(entry);

        toggl::JsonValue started;
        client.postRequest("start_time_entry", toggl::JsonValue(body), &started);

        std::cout << "Started: " << started.get("data").get("id").to_str()
                  << " \"" << description << "\"" << std::endl;

    } catch (const toggl::ApiError& e) {
        std::cerr << "Toggl rejected the request [" << e.api_code() << "]: "
                  << e.api_message() << std::endl;
        return 1;
    } catch (const toggl::TogglError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
