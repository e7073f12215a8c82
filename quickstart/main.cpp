#include <toggl/toggl.hpp>
#include <iostream>
#include <fstream>
#include <cstdlib>

// Load .env file into environment variables
void load_dotenv(const std::string& path) {
    std::ifstream file(path);
    std::string line;
    while (std::getline(file, line)) {
        if (line.empty() || line[0] == '#') continue;
        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = line.substr(0, eq);
        std::string val = line.substr(eq + 1);
        if (val.size() >= 2 && (val[0] == '"' || val[0] == '\''))
            val = val.substr(1, val.size() - 2);
        setenv(key.c_str(), val.c_str(), 0);
    }
}

int main() {
    load_dotenv("../.env");
    load_dotenv(".env");

    try {
        toggl::Resources resources;
        toggl::register_default_endpoints(resources);
        toggl::Client client(toggl::Config(), resources);

        // Weekly report for a workspace
        const char* ws = std::getenv("TOGGL_WORKSPACE_ID");
        if (ws) {
            resources.addEndpoint("my_weekly", toggl::Endpoint::custom(
                std::string(toggl::ENDPOINT_REPORT_WEEKLY) +
                "?user_agent=toggl-cpp&workspace_id=" + ws));

            toggl::JsonValue report;
            client.getRequest("my_weekly", report);
            std::cout << "Weekly total: " << report.get("total_grand").to_str() << "ms" << std::endl;
        }

        toggl::JsonValue workspaces;
        client.getRequest("workspaces", workspaces);
        std::cout << "Workspaces: " << workspaces.serialize() << std::endl;

        std::cout << "Done! SDK is working." << std::endl;

    } catch (const toggl::TogglError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
