/**
 * Toggl C++ SDK - Resource registry and endpoint tests.
 */

#undef NDEBUG

#include <toggl/toggl.hpp>
#include <iostream>
#include <cassert>
#include <string>

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name) \
    std::cout << "  " << #name << "... "; \
    try

#define PASS() \
    std::cout << "OK" << std::endl; \
    tests_passed++;

#define FAIL(msg) \
    std::cout << "FAIL: " << msg << std::endl; \
    tests_failed++;

// =============================================================================
// Endpoints
// =============================================================================

void test_endpoint_urls() {
    TEST(endpoint_urls) {
        assert(toggl::Endpoint(toggl::ENDPOINT_KIND_WORKSPACES).url_string() ==
               "https://www.toggl.com/api/v8/workspaces");
        assert(toggl::Endpoint(toggl::ENDPOINT_KIND_CLIENTS).url_string() ==
               "https://www.toggl.com/api/v8/clients");
        assert(toggl::Endpoint(toggl::ENDPOINT_KIND_REPORT_WEEKLY).url_string() ==
               "https://toggl.com/reports/api/v2/weekly");
        assert(toggl::Endpoint(toggl::ENDPOINT_KIND_REPORT_DETAILED).url_string() ==
               "https://toggl.com/reports/api/v2/details");
        assert(toggl::Endpoint(toggl::ENDPOINT_KIND_REPORT_SUMMARY).url_string() ==
               "https://toggl.com/reports/api/v2/summary");
        assert(toggl::Endpoint(toggl::ENDPOINT_KIND_START_TIME_ENTRY).url_string() ==
               "https://www.toggl.com/api/v8/time_entries/start");

        toggl::Url url = toggl::Endpoint(toggl::ENDPOINT_KIND_REPORT_SUMMARY).url();
        assert(url.scheme == "https");
        assert(url.host == "toggl.com");
        assert(url.path == "/reports/api/v2/summary");
        assert(url.query.empty());
        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

void test_custom_endpoint() {
    TEST(custom_endpoint) {
        toggl::Endpoint ep = toggl::Endpoint::custom("http://localhost:8080/api/x?page=2#top");
        assert(ep.kind() == toggl::ENDPOINT_KIND_CUSTOM);
        toggl::Url url = ep.url();
        assert(url.scheme == "http");
        assert(url.host == "localhost:8080");
        assert(url.path == "/api/x");
        assert(url.query == "page=2");
        assert(url.str() == "http://localhost:8080/api/x?page=2");
        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

void test_parse_url_rejects_malformed() {
    TEST(parse_url_rejects_malformed) {
        const char* bad[] = {
            "",
            "toggl.com/api",
            "://toggl.com",
            "1http://toggl.com",
            "https://",
            "https:///path",
            "https://toggl .com/",
            "https://toggl.com/a path"
        };
        for (size_t i = 0; i < sizeof(bad) / sizeof(bad[0]); ++i) {
            bool threw = false;
            try {
                toggl::parse_url(bad[i]);
            } catch (const toggl::InvalidRequestError&) {
                threw = true;
            }
            if (!threw) {
                throw std::runtime_error(std::string("accepted malformed URL: ") + bad[i]);
            }
        }
        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

void test_endpoint_kind_names() {
    TEST(endpoint_kind_names) {
        assert(std::string(toggl::endpoint_kind_to_string(toggl::ENDPOINT_KIND_WORKSPACES)) == "workspaces");
        assert(std::string(toggl::endpoint_kind_to_string(toggl::ENDPOINT_KIND_START_TIME_ENTRY)) == "start_time_entry");
        assert(std::string(toggl::endpoint_kind_to_string(toggl::ENDPOINT_KIND_CUSTOM)) == "custom");
        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

// =============================================================================
// Registry
// =============================================================================

void test_add_and_resolve() {
    TEST(add_and_resolve) {
        toggl::Resources resources;
        assert(resources.size() == 0);
        resources.addEndpoint("ws", toggl::Endpoint(toggl::ENDPOINT_KIND_WORKSPACES));
        assert(resources.size() == 1);
        assert(resources.contains("ws"));
        assert(resources.getURL("ws").str() == toggl::ENDPOINT_WORKSPACES);
        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

void test_duplicate_resource() {
    TEST(duplicate_resource) {
        toggl::Resources resources;
        resources.addEndpoint("ws", toggl::Endpoint(toggl::ENDPOINT_KIND_WORKSPACES));

        bool threw = false;
        try {
            resources.addEndpoint("ws", toggl::Endpoint(toggl::ENDPOINT_KIND_CLIENTS));
        } catch (const toggl::DuplicateResourceError& e) {
            threw = true;
            assert(e.name() == "ws");
            assert(std::string(e.what()) == "ws is already used.");
        }
        assert(threw);

        /* First registration wins */
        assert(resources.size() == 1);
        assert(resources.getURL("ws").str() == toggl::ENDPOINT_WORKSPACES);
        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

void test_unknown_resource() {
    TEST(unknown_resource) {
        toggl::Resources resources;
        resources.addEndpoint("ws", toggl::Endpoint(toggl::ENDPOINT_KIND_WORKSPACES));

        bool threw = false;
        try {
            toggl::Url url = resources.getURL("clients");
            (void)url;
        } catch (const toggl::UnknownResourceError& e) {
            threw = true;
            assert(e.name() == "clients");
        }
        assert(threw);
        assert(!resources.contains("clients"));
        assert(resources.size() == 1);
        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

void test_returned_url_is_a_copy() {
    TEST(returned_url_is_a_copy) {
        toggl::Resources resources;
        resources.addEndpoint("x", toggl::Endpoint::custom("https://example.com/api/x"));
        toggl::Url url = resources.getURL("x");
        url.path = "/elsewhere";
        assert(resources.getURL("x").path == "/api/x");
        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

void test_register_default_endpoints() {
    TEST(register_default_endpoints) {
        toggl::Resources resources;
        toggl::register_default_endpoints(resources);
        assert(resources.size() == 6);
        assert(resources.getURL("workspaces").str() == toggl::ENDPOINT_WORKSPACES);
        assert(resources.getURL("clients").str() == toggl::ENDPOINT_CLIENTS);
        assert(resources.getURL("report_weekly").str() == toggl::ENDPOINT_REPORT_WEEKLY);
        assert(resources.getURL("report_detailed").str() == toggl::ENDPOINT_REPORT_DETAILED);
        assert(resources.getURL("report_summary").str() == toggl::ENDPOINT_REPORT_SUMMARY);
        assert(resources.getURL("start_time_entry").str() == toggl::ENDPOINT_START_TIME);

        bool threw = false;
        try {
            toggl::register_default_endpoints(resources);
        } catch (const toggl::DuplicateResourceError&) {
            threw = true;
        }
        assert(threw);
        assert(resources.size() == 6);
        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

// =============================================================================
// Main
// =============================================================================

int main() {
    std::cout << "Toggl C++ SDK Resource Tests" << std::endl;
    std::cout << "============================" << std::endl;

    test_endpoint_urls();
    test_custom_endpoint();
    test_parse_url_rejects_malformed();
    test_endpoint_kind_names();
    test_add_and_resolve();
    test_duplicate_resource();
    test_unknown_resource();
    test_returned_url_is_a_copy();
    test_register_default_endpoints();

    std::cout << std::endl;
    std::cout << "Results: " << tests_passed << " passed, "
              << tests_failed << " failed" << std::endl;

    return tests_failed > 0 ? 1 : 0;
}
