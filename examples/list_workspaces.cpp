/**
 * Toggl C++ SDK - List Workspaces
 *
 * Verifies the token and prints the workspaces and clients it can see.
 *
 * Build:
 *   cmake -B build -DTOGGL_BUILD_EXAMPLES=ON && cmake --build build
 *
 * Run:
 *   export TOGGL_API_TOKEN="1971800d4d82861d8f2c1651fea4d212"
 *   ./build/toggl_list_workspaces
 */

#include <toggl/toggl.hpp>
#include <iostream>
#include <string>

static void print_named(const toggl::JsonValue& list) {
    if (!list.is<toggl::JsonArray>()) {
        std::cout << "  (none)" << std::endl;
        return;
    }
    const toggl::JsonArray& arr = list.get<toggl::JsonArray>();
    for (size_t i = 0; i < arr.size(); ++i) {
        if (!arr[i].is<toggl::JsonObject>()) continue;
        std::cout << "  " << arr[i].get("id").to_str()
                  << "  " << arr[i].get("name").to_str() << std::endl;
    }
}

int main() {
    std::cout << "Toggl C++ SDK v" << TOGGL_SDK_VERSION << std::endl;
    std::cout << "==========================================" << std::endl;

    try {
        toggl::Resources resources;
        toggl::register_default_endpoints(resources);

        toggl::Client client(toggl::Config(), resources);
        std::cout << "[1/3] Client initialized (" << client.user_agent() << ")" << std::endl;

        client.getRequest("workspaces");
        std::cout << "[2/3] Token accepted" << std::endl;

        toggl::JsonValue workspaces;
        client.getRequest("workspaces", workspaces);
        std::cout << "Workspaces:" << std::endl;
        print_named(workspaces);

        toggl::JsonValue clients;
        client.getRequest("clients", clients);
        std::cout << "[3/3] Clients:" << std::endl;
        print_named(clients);
        return 0;

    } catch (const toggl::ApiError& e) {
        std::cerr << "FAIL: API error [" << e.api_code() << "] - " << e.api_message() << std::endl;
        return 1;
    } catch (const toggl::NetworkError& e) {
        std::cerr << "FAIL: Network error - " << e.what() << std::endl;
        return 1;
    } catch (const toggl::TogglError& e) {
        std::cerr << "FAIL: " << e.code() << " - " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
