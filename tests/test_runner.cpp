// Test runner: runs all protocol, tool and configuration tests and reports results.

#include <iostream>
#include <vector>
#include <string>
#include <functional>
#include <chrono>

#include "tool_handlers/tool_handlers.hpp"

// Forward declarations of test functions from other test files.
namespace test_json_rpc {
    bool run_all_tests();
}

namespace test_row_materializer {
    bool run_all_tests();
}

namespace test_tool_handlers {
    bool run_all_tests();
}

namespace test_dispatch {
    bool run_all_tests();
}

namespace test_config {
    bool run_all_tests();
}

struct TestSuite {
    std::string name;
    std::function<bool()> runner;
};

int main() {
    std::vector<TestSuite> suites = {
        {"test_json_rpc", test_json_rpc::run_all_tests},
        {"test_row_materializer", test_row_materializer::run_all_tests},
        {"test_tool_handlers", test_tool_handlers::run_all_tests},
        {"test_dispatch", test_dispatch::run_all_tests},
        {"test_config", test_config::run_all_tests},
    };

    // The tool suites call through the same registry the server uses.
    tool_handlers::register_all_tools();

    int passed_count = 0;
    int failed_count = 0;
    auto total_start_time = std::chrono::steady_clock::now();

    std::cout << "=== SQLMCPS Test Runner ===" << std::endl;
    std::cout << std::endl;

    for (const auto &suite : suites) {
        std::cout << "--- " << suite.name << " ---" << std::endl;
        auto suite_start_time = std::chrono::steady_clock::now();

        bool suite_passed = suite.runner();

        auto suite_elapsed = std::chrono::steady_clock::now() - suite_start_time;
        long suite_milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(suite_elapsed).count();

        if (suite_passed) {
            std::cout << "  PASSED (" << suite_milliseconds << " ms)" << std::endl;
            passed_count++;
        } else {
            std::cout << "  FAILED (" << suite_milliseconds << " ms)" << std::endl;
            failed_count++;
        }
        std::cout << std::endl;
    }

    auto total_elapsed = std::chrono::steady_clock::now() - total_start_time;
    long total_milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(total_elapsed).count();

    std::cout << "=== Results ===" << std::endl;
    std::cout << "  Passed: " << passed_count << std::endl;
    std::cout << "  Failed: " << failed_count << std::endl;
    std::cout << "  Total time: " << total_milliseconds << " ms" << std::endl;

    return (failed_count == 0) ? 0 : 1;
}
