#pragma once

#include <exception>
#include <functional>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace zkemu::test {

/**
 * Simple test framework
 *
 * Tests register themselves through TEST(name); run() executes those
 * whose name contains the filter.
 */
class TestRunner {
public:
    struct TestResult {
        std::string name;
        bool passed;
        std::string message;
    };

    using TestFunc = std::function<bool(std::string&)>;

    static TestRunner& getInstance() {
        static TestRunner instance;
        return instance;
    }

    void addTest(const std::string& name, TestFunc func) {
        m_tests.push_back({name, func});
    }

    int run(const std::string& filter = "") {
        int passed = 0;
        int failed = 0;

        std::cout << "\n========================================\n";
        std::cout << "  Running Tests";
        if (!filter.empty()) {
            std::cout << " matching '" << filter << "'";
        }
        std::cout << "\n========================================\n\n";

        for (const auto& [name, func] : m_tests) {
            if (!filter.empty() && name.find(filter) == std::string::npos) {
                continue;
            }

            std::string message;
            bool result = false;

            try {
                result = func(message);
            } catch (const std::exception& e) {
                message = std::string("Exception: ") + e.what();
                result = false;
            }

            if (result) {
                std::cout << "  [PASS] " << name << "\n";
                passed++;
            } else {
                std::cout << "  [FAIL] " << name << "\n";
                if (!message.empty()) {
                    std::cout << "         " << message << "\n";
                }
                failed++;
            }

            m_results.push_back({name, result, message});
        }

        std::cout << "\n========================================\n";
        std::cout << "  Results: " << passed << " passed, " << failed << " failed\n";
        std::cout << "========================================\n\n";

        if (passed + failed == 0) {
            std::cout << "No test matched\n";
            return 1;
        }
        return failed > 0 ? 1 : 0;
    }

private:
    std::vector<std::pair<std::string, TestFunc>> m_tests;
    std::vector<TestResult> m_results;
};

// Test registration macro
#define TEST(name) \
    static bool test_##name(std::string& _msg); \
    static struct TestRegistrar_##name { \
        TestRegistrar_##name() { \
            zkemu::test::TestRunner::getInstance().addTest(#name, test_##name); \
        } \
    } testRegistrar_##name; \
    static bool test_##name([[maybe_unused]] std::string& _msg)

// Assertion macros
#define ASSERT_TRUE(expr) \
    if (!(expr)) { \
        _msg = "Expected true: " #expr; \
        return false; \
    }

#define ASSERT_FALSE(expr) \
    if (expr) { \
        _msg = "Expected false: " #expr; \
        return false; \
    }

#define ASSERT_EQ(a, b) \
    if ((a) != (b)) { \
        _msg = "Assertion failed: " #a " != " #b; \
        return false; \
    }

#define ASSERT_NE(a, b) \
    if ((a) == (b)) { \
        _msg = "Assertion failed: " #a " == " #b; \
        return false; \
    }

#define ASSERT_STREQ(a, b) \
    if (std::string(a) != std::string(b)) { \
        _msg = std::string("Expected \"") + (a) + "\" == \"" + (b) + "\""; \
        return false; \
    }

// Result<T> or Status must hold a value; evaluated once
#define ASSERT_OK(result) \
    { \
        const auto& _result = (result); \
        if (!_result) { \
            _msg = std::string(#result " failed: ") + _result.error().describe(); \
            return false; \
        } \
    }

// Result<T> or Status must hold an error with the given code; evaluated once
#define ASSERT_ERROR(result, errorCode) \
    { \
        const auto& _result = (result); \
        if (_result) { \
            _msg = "Expected an error from " #result; \
            return false; \
        } \
        if (_result.code() != (errorCode)) { \
            _msg = std::string(#result " failed with ") + _result.error().describe() + \
                   ", expected " + zkemu::errorCodeName(errorCode); \
            return false; \
        } \
    }

#define PASS() return true

} // namespace zkemu::test
