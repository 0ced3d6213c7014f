#pragma once
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>

/*
Minimal test harness shared by the test executables.

  TEST(name) { ASSERT_EQ(a, b); ... }
  int main() { RUN_TEST(name); return support::test_result(); }

Assertions stay active in release builds: a failed check throws
support::TestFailure, RUN_TEST reports it and moves on, and test_result()
turns the failure count into the process exit code.
*/

namespace support {

struct TestFailure : std::runtime_error {
    using std::runtime_error::runtime_error;
};

inline int& failure_count() {
    static int failures = 0;
    return failures;
}

inline void fail(const std::string& what, const char* file, int line) {
    throw TestFailure(std::string(file) + ":" + std::to_string(line) + ": " + what);
}

inline int test_result() {
    if (failure_count() == 0) {
        std::cout << "\nAll tests passed!\n";
        return 0;
    }
    std::cout << "\n" << failure_count() << " test(s) FAILED\n";
    return 1;
}

} // namespace support

#define TEST(name) void name()

#define RUN_TEST(name)                                                        \
    do {                                                                      \
        std::cout << "  " << #name << "... ";                                 \
        try {                                                                 \
            name();                                                           \
            std::cout << "PASSED\n";                                          \
        } catch (const support::TestFailure& f) {                             \
            std::cout << "FAILED\n    " << f.what() << "\n";                  \
            ++support::failure_count();                                       \
        } catch (const std::exception& e) {                                   \
            std::cout << "FAILED\n    unexpected exception: " << e.what() << "\n"; \
            ++support::failure_count();                                       \
        }                                                                     \
    } while (0)

#define ASSERT_TRUE(cond)                                                     \
    do {                                                                      \
        if (!(cond)) support::fail("expected " #cond, __FILE__, __LINE__);   \
    } while (0)

#define ASSERT_FALSE(cond)                                                    \
    do {                                                                      \
        if (cond) support::fail("expected !(" #cond ")", __FILE__, __LINE__); \
    } while (0)

#define ASSERT_EQ(a, b)                                                       \
    do {                                                                      \
        if (!((a) == (b))) support::fail("expected " #a " == " #b, __FILE__, __LINE__); \
    } while (0)

#define ASSERT_NE(a, b)                                                       \
    do {                                                                      \
        if ((a) == (b)) support::fail("expected " #a " != " #b, __FILE__, __LINE__); \
    } while (0)

#define ASSERT_THROWS(expr, ExceptionType)                                    \
    do {                                                                      \
        bool caught_ = false;                                                 \
        try {                                                                 \
            (void)(expr);                                                     \
        } catch (const ExceptionType&) {                                      \
            caught_ = true;                                                   \
        }                                                                     \
        if (!caught_) support::fail("expected " #expr " to throw " #ExceptionType, __FILE__, __LINE__); \
    } while (0)
