#ifndef MARIONETTE_TEST_HARNESS_H
#define MARIONETTE_TEST_HARNESS_H

#include <cmath>
#include <functional>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace marionette {
namespace testing {

class TestFailure : public std::runtime_error {
public:
    explicit TestFailure(const std::string& message) : std::runtime_error(message) {}
};

inline std::string location(const char* file, int line) {
    std::ostringstream ss;
    ss << file << ":" << line;
    return ss.str();
}

using TestCase = std::pair<std::string, std::function<void()>>;

/**
 * @brief Run every case, keep going after failures
 * @return Process exit code: 0 when all cases passed
 */
inline int runTests(const std::string& suiteName, const std::vector<TestCase>& cases) {
    std::cout << "=== " << suiteName << " ===\n\n";
    int failures = 0;
    for (const auto& testCase : cases) {
        try {
            testCase.second();
        } catch (const std::exception& e) {
            ++failures;
            std::cerr << "[FAILED] " << testCase.first << ": " << e.what() << "\n\n";
        }
    }
    if (failures == 0) {
        std::cout << "=== All " << cases.size() << " tests passed ===\n";
        return 0;
    }
    std::cerr << "=== " << failures << " of " << cases.size() << " tests failed ===\n";
    return 1;
}

} // namespace testing
} // namespace marionette

#define CHECK(condition) \
    do { \
        if (!(condition)) { \
            throw marionette::testing::TestFailure( \
                marionette::testing::location(__FILE__, __LINE__) + ": CHECK(" #condition ") failed"); \
        } \
    } while (0)

#define CHECK_EQ(actual, expected) \
    do { \
        const auto _actual = (actual); \
        const auto _expected = (expected); \
        if (!(_actual == _expected)) { \
            std::ostringstream _ss; \
            _ss << marionette::testing::location(__FILE__, __LINE__) << ": " #actual " == " #expected \
                << " failed: got " << _actual << ", expected " << _expected; \
            throw marionette::testing::TestFailure(_ss.str()); \
        } \
    } while (0)

#define CHECK_NEAR(actual, expected, tolerance) \
    do { \
        double _actual = (actual); \
        double _expected = (expected); \
        if (std::fabs(_actual - _expected) > (tolerance)) { \
            std::ostringstream _ss; \
            _ss << marionette::testing::location(__FILE__, __LINE__) << ": " #actual " ~= " #expected \
                << " failed: got " << _actual << ", expected " << _expected; \
            throw marionette::testing::TestFailure(_ss.str()); \
        } \
    } while (0)

// Passes only if statement throws exceptionType (or a subclass)
#define CHECK_THROWS(statement, exceptionType) \
    do { \
        bool _thrown = false; \
        try { \
            statement; \
        } catch (const exceptionType&) { \
            _thrown = true; \
        } \
        if (!_thrown) { \
            throw marionette::testing::TestFailure( \
                marionette::testing::location(__FILE__, __LINE__) + ": " #statement \
                " did not throw " #exceptionType); \
        } \
    } while (0)

#endif // MARIONETTE_TEST_HARNESS_H
