#pragma once

// =============================================================================
// stmap - Test Registration and Execution Framework
// =============================================================================
//
// Self-contained test framework with pytest-style output.
//
// Features:
//   - Auto-registration via __COUNTER__
//   - Test suites and grouping
//   - Runtime skips (STMAP_SKIP_IF)
//   - Assertion macros with expected / actual reporting
//   - Colored terminal output
//
// Usage:
//   STMAP_TEST_BEGIN
//
//   STMAP_TEST_UNIT(my_test) {
//       STMAP_ASSERT_EQ(1 + 1, 2);
//   }
//
//   STMAP_TEST_SUITE(math_tests)
//   STMAP_TEST_CASE(addition) { ... }
//   STMAP_TEST_SUITE_END
//
//   STMAP_TEST_END
//   STMAP_TEST_MAIN()
//
// CLI:
//   ./test --help                     # Show all options
//   ./test --filter "softmax"         # Filter by name pattern (suite.name)
//   ./test --fail-fast                # Stop on first failure
//   ./test --list                     # List tests and exit
//   ./test --no-color                 # Plain output
//   ./test -v                         # Verbose output
//
// =============================================================================

#ifndef STMAP_TEST_HPP
#define STMAP_TEST_HPP

#include <array>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#if defined(__unix__) || defined(__APPLE__)
#include <unistd.h>
#define STMAP_TEST_UNIX_LIKE 1
#else
#define STMAP_TEST_UNIX_LIKE 0
#endif

// =============================================================================
// Configuration
// =============================================================================

namespace stmap::test {

constexpr std::size_t MAX_TEST_UNITS = 512;

} // namespace stmap::test

// =============================================================================
// ANSI Color Codes
// =============================================================================

namespace stmap::test::color {

constexpr const char* RESET = "\033[0m";
constexpr const char* BOLD = "\033[1m";
constexpr const char* DIM = "\033[2m";
constexpr const char* GREEN = "\033[38;5;114m";
constexpr const char* RED = "\033[38;5;203m";
constexpr const char* YELLOW = "\033[38;5;221m";
constexpr const char* CYAN = "\033[38;5;116m";

} // namespace stmap::test::color

// =============================================================================
// Exception Classes
// =============================================================================

namespace stmap::test {

class TestException : public std::exception {
public:
    TestException(const char* file, int line, const std::string& message,
                  const std::string& expected = "", const std::string& actual = "") {
        std::ostringstream oss;
        oss << file << ":" << line << ": " << message;
        if (!expected.empty() || !actual.empty()) {
            oss << "\n  Expected: " << expected << "\n  Actual:   " << actual;
        }
        text_ = oss.str();
    }

    const char* what() const noexcept override { return text_.c_str(); }

private:
    std::string text_;
};

class SkipException : public std::exception {
public:
    explicit SkipException(std::string reason) : reason_(std::move(reason)) {}
    const char* what() const noexcept override { return reason_.c_str(); }

private:
    std::string reason_;
};

} // namespace stmap::test

// =============================================================================
// Test Metadata and Results
// =============================================================================

namespace stmap::test {

enum class TestStatus {
    PASSED,
    FAILED,
    SKIPPED,
    ERROR
};

using test_func_t = void(*)();

struct TestInfo {
    test_func_t func = nullptr;
    const char* name_str = nullptr;
    const char* file = nullptr;
    int line = 0;
    const char* suite = nullptr;

    [[nodiscard]] std::string full_name() const {
        return suite ? std::string(suite) + "." + name_str : std::string(name_str);
    }
};

struct TestResult {
    const TestInfo* test = nullptr;
    TestStatus status = TestStatus::PASSED;
    double duration_ms = 0.0;
    std::string message;
};

} // namespace stmap::test

// =============================================================================
// Global Test Storage
// =============================================================================

namespace stmap::test::detail {

inline std::array<TestInfo, MAX_TEST_UNITS>& get_tests() {
    static std::array<TestInfo, MAX_TEST_UNITS> tests{};
    return tests;
}

inline std::size_t& get_count() {
    static std::size_t count = 0;
    return count;
}

inline const char*& current_suite() {
    static const char* suite = nullptr;
    return suite;
}

} // namespace stmap::test::detail

// =============================================================================
// Test Configuration and CLI
// =============================================================================

namespace stmap::test {

struct Config {
    std::vector<std::string> filters;
    bool verbose = false;
    bool fail_fast = false;
    bool list_tests = false;
    bool use_color = true;

    static Config& instance() {
        static Config cfg;
        return cfg;
    }
};

inline void print_help(const char* program) {
    std::printf("Usage: %s [options]\n\n", program);
    std::printf("Options:\n");
    std::printf("  -h, --help            Show this message\n");
    std::printf("  -f, --filter PATTERN  Run tests whose name contains PATTERN (repeatable)\n");
    std::printf("  -x, --fail-fast       Stop after the first failure\n");
    std::printf("  -l, --list            List registered tests\n");
    std::printf("  -v, --verbose         Print failure details and skip reasons\n");
    std::printf("      --no-color        Disable ANSI colors\n");
}

inline void parse_args(int argc, char* argv[]) {
    auto& cfg = Config::instance();
#if STMAP_TEST_UNIX_LIKE
    cfg.use_color = isatty(fileno(stdout)) != 0;
#else
    cfg.use_color = false;
#endif
    if (std::getenv("NO_COLOR") != nullptr) {
        cfg.use_color = false;
    }

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_help(argv[0]);
            std::exit(0);
        } else if ((arg == "-f" || arg == "--filter") && i + 1 < argc) {
            cfg.filters.emplace_back(argv[++i]);
        } else if (arg == "-x" || arg == "--fail-fast") {
            cfg.fail_fast = true;
        } else if (arg == "-l" || arg == "--list") {
            cfg.list_tests = true;
        } else if (arg == "-v" || arg == "--verbose") {
            cfg.verbose = true;
        } else if (arg == "--no-color") {
            cfg.use_color = false;
        } else {
            std::fprintf(stderr, "Unknown option: %s\n", arg.c_str());
            print_help(argv[0]);
            std::exit(2);
        }
    }
}

// =============================================================================
// Test Runner
// =============================================================================

class Runner {
public:
    Runner() : cfg_(Config::instance()) {}

    int run() {
        const auto& tests = detail::get_tests();
        const std::size_t count = detail::get_count();

        std::vector<const TestInfo*> selected;
        for (std::size_t i = 0; i < count; ++i) {
            if (tests[i].func == nullptr) continue;
            if (!matches(tests[i])) continue;
            selected.push_back(&tests[i]);
        }

        if (cfg_.list_tests) {
            for (const TestInfo* t : selected) {
                std::printf("%s\n", t->full_name().c_str());
            }
            return 0;
        }

        std::printf("%scollected %zu tests%s\n\n", paint(color::BOLD), selected.size(),
                    paint(color::RESET));

        const auto start = std::chrono::steady_clock::now();
        std::vector<TestResult> results;
        for (const TestInfo* t : selected) {
            results.push_back(run_test(*t));
            report(results.back());
            if (cfg_.fail_fast && is_failure(results.back().status)) {
                break;
            }
        }
        const double total_s =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

        return summarize(results, total_s);
    }

private:
    static bool is_failure(TestStatus s) noexcept {
        return s == TestStatus::FAILED || s == TestStatus::ERROR;
    }

    const char* paint(const char* code) const noexcept {
        return cfg_.use_color ? code : "";
    }

    bool matches(const TestInfo& t) const {
        if (cfg_.filters.empty()) return true;
        const std::string name = t.full_name();
        for (const auto& f : cfg_.filters) {
            if (name.find(f) != std::string::npos) return true;
        }
        return false;
    }

    static TestResult run_test(const TestInfo& t) {
        TestResult r;
        r.test = &t;
        const auto start = std::chrono::steady_clock::now();
        try {
            t.func();
            r.status = TestStatus::PASSED;
        } catch (const TestException& e) {
            r.status = TestStatus::FAILED;
            r.message = e.what();
        } catch (const SkipException& e) {
            r.status = TestStatus::SKIPPED;
            r.message = e.what();
        } catch (const std::exception& e) {
            r.status = TestStatus::ERROR;
            r.message = std::string("Unhandled exception: ") + e.what();
        } catch (...) {
            r.status = TestStatus::ERROR;
            r.message = "Unhandled non-standard exception";
        }
        r.duration_ms = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start).count();
        return r;
    }

    void report(const TestResult& r) const {
        const char* tag = "PASS";
        const char* col = color::GREEN;
        switch (r.status) {
            case TestStatus::PASSED:  break;
            case TestStatus::FAILED:  tag = "FAIL"; col = color::RED; break;
            case TestStatus::SKIPPED: tag = "SKIP"; col = color::YELLOW; break;
            case TestStatus::ERROR:   tag = "ERROR"; col = color::RED; break;
        }
        std::printf("%s[%s]%s %s %s(%.1f ms)%s\n", paint(col), tag, paint(color::RESET),
                    r.test->full_name().c_str(), paint(color::DIM), r.duration_ms,
                    paint(color::RESET));

        const bool show = is_failure(r.status) ||
                          (cfg_.verbose && r.status == TestStatus::SKIPPED);
        if (show && !r.message.empty()) {
            std::printf("    %s%s%s\n", paint(color::CYAN), r.message.c_str(), paint(color::RESET));
        }
    }

    int summarize(const std::vector<TestResult>& results, double total_s) const {
        std::size_t passed = 0, failed = 0, skipped = 0, errors = 0;
        for (const auto& r : results) {
            switch (r.status) {
                case TestStatus::PASSED:  ++passed; break;
                case TestStatus::FAILED:  ++failed; break;
                case TestStatus::SKIPPED: ++skipped; break;
                case TestStatus::ERROR:   ++errors; break;
            }
        }

        const bool ok = failed == 0 && errors == 0;
        std::printf("\n%s%s== %zu passed, %zu failed, %zu errors, %zu skipped in %.2fs ==%s\n",
                    paint(color::BOLD), paint(ok ? color::GREEN : color::RED),
                    passed, failed, errors, skipped, total_s, paint(color::RESET));

        if (!ok) {
            std::printf("\nFailures:\n");
            for (const auto& r : results) {
                if (is_failure(r.status)) {
                    std::printf("  %s\n    %s\n", r.test->full_name().c_str(), r.message.c_str());
                }
            }
        }
        return ok ? 0 : 1;
    }

    const Config& cfg_;
};

} // namespace stmap::test

// =============================================================================
// Assertion Macros
// =============================================================================

namespace stmap::test::detail {

template<typename T>
inline std::string to_string_impl(const T& value) {
    if constexpr (std::is_enum_v<T>) {
        return std::to_string(static_cast<long long>(value));
    } else {
        std::ostringstream oss;
        oss << std::boolalpha << value;
        return oss.str();
    }
}

inline std::string to_string_impl(const char* value) {
    return value ? std::string("\"") + value + "\"" : "nullptr";
}

inline std::string to_string_impl(const std::string& value) {
    return "\"" + value + "\"";
}

inline std::string to_string_impl(std::nullptr_t) {
    return "nullptr";
}

template<typename T>
inline std::string to_string_impl(T* ptr) {
    if (!ptr) return "nullptr";
    std::ostringstream oss;
    oss << "0x" << std::hex << reinterpret_cast<std::uintptr_t>(ptr);
    return oss.str();
}

template<typename T>
inline std::string value_to_string(const T& value) {
    return to_string_impl(value);
}

} // namespace stmap::test::detail

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

#define STMAP_TEST_BINARY_(a, b, op, text) \
    do { \
        auto&& _a = (a); \
        auto&& _b = (b); \
        if (!(_a op _b)) { \
            throw ::stmap::test::TestException(__FILE__, __LINE__, \
                text ": " #a " " #op " " #b, \
                ::stmap::test::detail::value_to_string(_a), \
                ::stmap::test::detail::value_to_string(_b)); \
        } \
    } while (0)

/// Equality assertion
#define STMAP_ASSERT_EQ(expected, actual) STMAP_TEST_BINARY_(expected, actual, ==, "Expected equality")
#define STMAP_ASSERT_NE(expected, actual) STMAP_TEST_BINARY_(expected, actual, !=, "Expected inequality")
#define STMAP_ASSERT_LT(a, b) STMAP_TEST_BINARY_(a, b, <, "Expected less")
#define STMAP_ASSERT_LE(a, b) STMAP_TEST_BINARY_(a, b, <=, "Expected less or equal")
#define STMAP_ASSERT_GT(a, b) STMAP_TEST_BINARY_(a, b, >, "Expected greater")
#define STMAP_ASSERT_GE(a, b) STMAP_TEST_BINARY_(a, b, >=, "Expected greater or equal")

#define STMAP_ASSERT_TRUE(expr) \
    do { \
        if (!(expr)) { \
            throw ::stmap::test::TestException(__FILE__, __LINE__, \
                "Expected true: " #expr, "true", "false"); \
        } \
    } while (0)

#define STMAP_ASSERT_FALSE(expr) \
    do { \
        if (expr) { \
            throw ::stmap::test::TestException(__FILE__, __LINE__, \
                "Expected false: " #expr, "false", "true"); \
        } \
    } while (0)

#define STMAP_ASSERT_NOT_NULL(ptr) \
    do { \
        if ((ptr) == nullptr) { \
            throw ::stmap::test::TestException(__FILE__, __LINE__, \
                "Expected non-null: " #ptr, "non-null", "nullptr"); \
        } \
    } while (0)

/// |expected - actual| <= tolerance, compared in double
#define STMAP_ASSERT_NEAR(expected, actual, tolerance) \
    do { \
        auto _exp = static_cast<double>(expected); \
        auto _act = static_cast<double>(actual); \
        auto _tol = static_cast<double>(tolerance); \
        if (!(std::abs(_exp - _act) <= _tol)) { \
            throw ::stmap::test::TestException(__FILE__, __LINE__, \
                "Expected near: |" #expected " - " #actual "| <= " #tolerance, \
                std::to_string(_exp) + " +- " + std::to_string(_tol), \
                std::to_string(_act)); \
        } \
    } while (0)

#define STMAP_ASSERT_STR_EQ(expected, actual) \
    do { \
        std::string _exp(expected); \
        std::string _act(actual); \
        if (_exp != _act) { \
            throw ::stmap::test::TestException(__FILE__, __LINE__, \
                "String mismatch", "\"" + _exp + "\"", "\"" + _act + "\""); \
        } \
    } while (0)

#define STMAP_ASSERT_STR_CONTAINS(haystack, needle) \
    do { \
        std::string _hay(haystack); \
        std::string _ndl(needle); \
        if (_hay.find(_ndl) == std::string::npos) { \
            throw ::stmap::test::TestException(__FILE__, __LINE__, \
                "String does not contain substring", \
                "contains \"" + _ndl + "\"", "\"" + _hay + "\""); \
        } \
    } while (0)

/// Exception assertion; a different exception type fails the test
#define STMAP_ASSERT_THROWS(expr, exception_type) \
    do { \
        bool _caught = false; \
        try { \
            expr; \
        } catch (const exception_type&) { \
            _caught = true; \
        } catch (const std::exception& _e) { \
            throw ::stmap::test::TestException(__FILE__, __LINE__, \
                "Wrong exception type thrown by: " #expr, \
                #exception_type, _e.what()); \
        } \
        if (!_caught) { \
            throw ::stmap::test::TestException(__FILE__, __LINE__, \
                "Expected exception not thrown: " #expr, \
                #exception_type, "no exception"); \
        } \
    } while (0)

#define STMAP_ASSERT_NO_THROW(expr) \
    do { \
        try { \
            expr; \
        } catch (const std::exception& _e) { \
            throw ::stmap::test::TestException(__FILE__, __LINE__, \
                "Unexpected exception: " #expr, "no exception", _e.what()); \
        } \
    } while (0)

#define STMAP_FAIL(msg) \
    throw ::stmap::test::TestException(__FILE__, __LINE__, msg)

#define STMAP_SKIP_IF(condition, reason) \
    do { \
        if (condition) { \
            throw ::stmap::test::SkipException(reason); \
        } \
    } while (0)

// =============================================================================
// Test Registration Macros
// =============================================================================

#define STMAP_TEST_REGISTER_(name) \
    static void _stmap_test_##name(); \
    [[maybe_unused]] static bool _stmap_reg_##name = []() { \
        constexpr std::size_t idx = __COUNTER__ - _stmap_test_base - 1; \
        static_assert(idx < ::stmap::test::MAX_TEST_UNITS, "too many tests in one file"); \
        auto& test_info = ::stmap::test::detail::get_tests()[idx]; \
        test_info.func = _stmap_test_##name; \
        test_info.name_str = #name; \
        test_info.file = __FILE__; \
        test_info.line = __LINE__; \
        test_info.suite = ::stmap::test::detail::current_suite(); \
        if (idx + 1 > ::stmap::test::detail::get_count()) { \
            ::stmap::test::detail::get_count() = idx + 1; \
        } \
        return true; \
    }(); \
    static void _stmap_test_##name()

/// Begin test file
#define STMAP_TEST_BEGIN \
    namespace { \
    static constexpr std::size_t _stmap_test_base = __COUNTER__;

/// Define a test unit
#define STMAP_TEST_UNIT(name) STMAP_TEST_REGISTER_(name)

/// Begin a test suite
#define STMAP_TEST_SUITE(name) \
    namespace _stmap_suite_##name { \
    [[maybe_unused]] static bool _stmap_suite_init = []() { \
        ::stmap::test::detail::current_suite() = #name; \
        return true; \
    }();

/// End a test suite
#define STMAP_TEST_SUITE_END \
    [[maybe_unused]] static bool _stmap_suite_cleanup = []() { \
        ::stmap::test::detail::current_suite() = nullptr; \
        return true; \
    }(); \
    }

/// Test case within a suite
#define STMAP_TEST_CASE(name) STMAP_TEST_UNIT(name)

/// End test file
#define STMAP_TEST_END \
    } /* anonymous namespace */

/// Generate main() with CLI support
#define STMAP_TEST_MAIN() \
    int main(int argc, char* argv[]) { \
        ::stmap::test::parse_args(argc, argv); \
        ::stmap::test::Runner runner; \
        return runner.run(); \
    }

// NOLINTEND(cppcoreguidelines-macro-usage)

#endif // STMAP_TEST_HPP
