// Test main file - Catch2 provides main() function
// This file is intentionally minimal as Catch2WithMain handles everything

#include <catch2/catch_test_macros.hpp>
#include "../tests/utils/test_doubles.hpp"

// Simple smoke test to verify test framework is working
TEST_CASE("Framework smoke test", "[smoke]") {
    REQUIRE(1 + 1 == 2);
}

// Pipeline logging is captured in every test run
TEST_CASE("Log capture smoke test", "[smoke]") {
    auto& logs = test_utils::LogCapture::instance();
    logs.clear();
    PLOG_WARNING << "capture check";
    REQUIRE(logs.contains("capture check", plog::warning));
}
