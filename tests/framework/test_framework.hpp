#pragma once
#include <iostream>
#include <vector>
#include <string>
#include <functional>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace humanize::test {

struct TestResult {
    std::string name;
    bool passed = false;
    std::string message;
    double duration_ms = 0.0;
};

class TestSuite {
private:
    std::string name_;
    std::vector<std::pair<std::string, std::function<void()>>> tests_;
    std::vector<TestResult> results_;
    int passed_ = 0, failed_ = 0;

public:
    explicit TestSuite(std::string name) : name_(std::move(name)) {}

    void add_test(std::string name, std::function<void()> test) {
        tests_.emplace_back(std::move(name), std::move(test));
    }

    void run() {
        std::cout << "\n=== " << name_ << " ===\n";

        for (const auto& [name, test] : tests_) {
            TestResult result;
            result.name = name;

            auto start = std::chrono::steady_clock::now();
            try {
                test();
                result.passed = true;
                passed_++;
            } catch (const std::exception& e) {
                result.passed = false;
                result.message = e.what();
                failed_++;
            }
            auto end = std::chrono::steady_clock::now();
            result.duration_ms = std::chrono::duration<double, std::milli>(end - start).count();

            std::cout << (result.passed ? "[PASS]" : "[FAIL]") << " " << name;
            std::cout << " (" << std::fixed << std::setprecision(2) << result.duration_ms << "ms)";
            if (!result.passed) std::cout << "\n       " << result.message;
            std::cout << "\n";

            results_.push_back(std::move(result));
        }

        std::cout << "\nResults: " << passed_ << " passed, " << failed_ << " failed\n";
    }

    [[nodiscard]] int passed() const { return passed_; }
    [[nodiscard]] int failed() const { return failed_; }
    [[nodiscard]] const std::vector<TestResult>& results() const { return results_; }
};

class TestRunner {
private:
    std::vector<TestSuite*> suites_;

public:
    void add_suite(TestSuite* suite) { suites_.push_back(suite); }

    int run_all() {
        int total_passed = 0, total_failed = 0;

        std::cout << "\n+==============================================================+\n";
        std::cout << "|                    Humanize Test Runner                      |\n";
        std::cout << "+==============================================================+\n";

        auto start = std::chrono::steady_clock::now();

        for (auto* suite : suites_) {
            suite->run();
            total_passed += suite->passed();
            total_failed += suite->failed();
        }

        auto end = std::chrono::steady_clock::now();
        double total_ms = std::chrono::duration<double, std::milli>(end - start).count();

        std::cout << "\n==============================================================\n";
        std::cout << "Total: " << total_passed << " passed, " << total_failed << " failed";
        std::cout << " (" << std::fixed << std::setprecision(2) << total_ms << "ms)\n";
        std::cout << "==============================================================\n";

        return total_failed == 0 ? 0 : 1;
    }
};

namespace detail {

[[noreturn]] inline void fail(const char* what, const char* file, int line, const std::string& extra = "") {
    std::ostringstream oss;
    oss << "Assertion failed: " << what << " (" << file << ":" << line << ")";
    if (!extra.empty()) oss << " " << extra;
    throw std::runtime_error(oss.str());
}

} // namespace detail

// Assertion macros
#define HUMANIZE_TEST_FAIL(what, ...) ::humanize::test::detail::fail(what, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)

#define ASSERT_TRUE(cond) do { if (!(cond)) HUMANIZE_TEST_FAIL(#cond); } while(0)
#define ASSERT_FALSE(cond) do { if (cond) HUMANIZE_TEST_FAIL("NOT " #cond); } while(0)
#define ASSERT_EQ(a, b) do { if (!((a) == (b))) HUMANIZE_TEST_FAIL(#a " == " #b); } while(0)
#define ASSERT_NE(a, b) do { if ((a) == (b)) HUMANIZE_TEST_FAIL(#a " != " #b); } while(0)
#define ASSERT_LT(a, b) do { if (!((a) < (b))) HUMANIZE_TEST_FAIL(#a " < " #b); } while(0)
#define ASSERT_LE(a, b) do { if (!((a) <= (b))) HUMANIZE_TEST_FAIL(#a " <= " #b); } while(0)
#define ASSERT_GT(a, b) do { if (!((a) > (b))) HUMANIZE_TEST_FAIL(#a " > " #b); } while(0)
#define ASSERT_GE(a, b) do { if (!((a) >= (b))) HUMANIZE_TEST_FAIL(#a " >= " #b); } while(0)
#define ASSERT_THROW(expr, exc) do { bool caught = false; try { expr; } catch (const exc&) { caught = true; } if (!caught) HUMANIZE_TEST_FAIL("expected " #exc " from " #expr); } while(0)
#define ASSERT_NO_THROW(expr) do { try { expr; } catch (const std::exception& e) { HUMANIZE_TEST_FAIL("unexpected exception in " #expr, e.what()); } } while(0)

// Result<T> helpers; the including file provides humanize::error_name
#define ASSERT_OK(expr) do { auto _r = (expr); if (_r.is_error()) HUMANIZE_TEST_FAIL(#expr " succeeds", std::string("got ") + std::string(::humanize::error_name(_r.error()))); } while(0)
#define ASSERT_ERROR(expr, code) do { auto _r = (expr); if (_r.is_success()) HUMANIZE_TEST_FAIL(#expr " fails with " #code, "but it succeeded"); if (_r.error() != (code)) HUMANIZE_TEST_FAIL(#expr " fails with " #code, std::string("got ") + std::string(::humanize::error_name(_r.error()))); } while(0)

} // namespace humanize::test
