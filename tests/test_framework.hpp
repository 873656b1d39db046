/**
 * @file test_framework.hpp
 * @brief Header-only test registration and assertions for the etrace tests.
 *
 * Usage:
 * @code
 * #include "test_framework.hpp"
 *
 * TEST(begin_increments_depth) {
 *     etrace::Tracer tracer;
 *     tracer.begin("a");
 *     TEST_ASSERT_EQ(tracer.depth(), 1, "one open span");
 * }
 *
 * int main(int argc, char** argv) {
 *     return run_tests(argc, argv);
 * }
 * @endcode
 *
 * Command line: `--list` prints the registered tests, a bare argument runs
 * only tests whose name contains it.
 */

#pragma once

#include <cstdio>
#include <cstring>
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace test_framework {

/**
 * @brief Thrown when a test assertion fails.
 */
class AssertionFailure : public std::runtime_error {
public:
    explicit AssertionFailure(const char* msg) : std::runtime_error(msg) {}
};

struct TestCase {
    const char* name;
    std::function<void()> func;
};

/**
 * @brief Tests in registration (source) order.
 *
 * Function-local static so registration from static initializers in any
 * translation unit is safe.
 */
inline std::vector<TestCase>& registry() {
    static std::vector<TestCase> tests;
    return tests;
}

struct TestRegistrar {
    TestRegistrar(const char* name, std::function<void()> func) {
        registry().push_back(TestCase{name, std::move(func)});
    }
};

inline bool matches_filter(const char* test_name, const char* filter) {
    return !filter || filter[0] == '\0' || std::strstr(test_name, filter) != nullptr;
}

/**
 * @brief Run registered tests matching the optional filter argument.
 * @return 0 if all selected tests pass, 1 otherwise
 */
inline int run_tests(int argc, char** argv) {
    const char* filter = nullptr;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            std::printf("Usage: %s [--list] [TEST_FILTER]\n", argv[0]);
            return 0;
        }
        if (std::strcmp(argv[i], "--list") == 0 || std::strcmp(argv[i], "-l") == 0) {
            for (const auto& t : registry()) {
                std::printf("  %s\n", t.name);
            }
            return 0;
        }
        if (argv[i][0] != '-' && !filter) {
            filter = argv[i];
        }
    }

    size_t passed = 0;
    size_t failed = 0;
    for (const auto& test : registry()) {
        if (!matches_filter(test.name, filter)) {
            continue;
        }
        std::printf("[ RUN  ] %s\n", test.name);
        std::fflush(stdout);
        try {
            test.func();
            std::printf("[  OK  ] %s\n", test.name);
            ++passed;
        }
        catch (const AssertionFailure& e) {
            std::printf("[ FAIL ] %s\n       %s\n", test.name, e.what());
            ++failed;
        }
        catch (const std::exception& e) {
            std::printf("[ FAIL ] %s (exception)\n       %s\n", test.name, e.what());
            ++failed;
        }
    }

    if (passed + failed == 0) {
        std::printf("No tests match filter: '%s'\n", filter ? filter : "");
        return 1;
    }
    std::printf("\nPassed: %zu  Failed: %zu  Total: %zu\n", passed, failed, passed + failed);
    return failed == 0 ? 0 : 1;
}

} // namespace test_framework

/**
 * @def TEST(name)
 * @brief Define and register a test case. name must be an identifier.
 */
#define TEST(name) \
    static void test_##name(); \
    static test_framework::TestRegistrar test_registrar_##name(#name, test_##name); \
    static void test_##name()

#define TEST_FAIL_(fmt, ...) \
    do { \
        char buf[1024]; \
        std::snprintf(buf, sizeof(buf), "%s:%d: " fmt, __FILE__, __LINE__, __VA_ARGS__); \
        throw test_framework::AssertionFailure(buf); \
    } while (0)

/**
 * @def TEST_ASSERT(condition, message)
 * @brief Fail the test unless condition holds.
 */
#define TEST_ASSERT(condition, message) \
    do { \
        if (!(condition)) { \
            TEST_FAIL_("Assertion failed: %s (%s)", #condition, message); \
        } \
    } while (0)

/**
 * @def TEST_ASSERT_EQ(a, b, message)
 */
#define TEST_ASSERT_EQ(a, b, message) \
    do { \
        if (!((a) == (b))) { \
            TEST_FAIL_("Assertion failed: %s == %s (%s)", #a, #b, message); \
        } \
    } while (0)

/**
 * @def TEST_ASSERT_NE(a, b, message)
 */
#define TEST_ASSERT_NE(a, b, message) \
    do { \
        if (!((a) != (b))) { \
            TEST_FAIL_("Assertion failed: %s != %s (%s)", #a, #b, message); \
        } \
    } while (0)

/**
 * @def TEST_ASSERT_THROWS(statement, exception_type, message)
 * @brief Fail the test unless statement throws exception_type.
 *
 * Any other exception propagates and fails the test with its own message.
 */
#define TEST_ASSERT_THROWS(statement, exception_type, message) \
    do { \
        bool threw_ = false; \
        try { \
            statement; \
        } \
        catch (const exception_type&) { \
            threw_ = true; \
        } \
        if (!threw_) { \
            TEST_FAIL_("Expected %s from: %s (%s)", #exception_type, #statement, message); \
        } \
    } while (0)

using test_framework::run_tests;
