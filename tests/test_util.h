// Minimal test harness shared by the test programs
#pragma once

#include <chrono>
#include <cmath>
#include <cstdio>
#include <functional>
#include <thread>

#define TEST_ASSERT(condition, message) \
    do { \
        if (!(condition)) { \
            fprintf(stderr, "FAIL: %s - %s (%s:%d)\n", __func__, message, __FILE__, __LINE__); \
            return false; \
        } \
    } while(0)

#define TEST_NEAR(a, b, eps, message) TEST_ASSERT(std::fabs((a) - (b)) <= (eps), message)

#define RUN_TEST(test_func) \
    do { \
        printf("Running: %s ... ", #test_func); \
        fflush(stdout); \
        if (test_func()) { \
            printf("PASS\n"); \
            passed++; \
        } else { \
            printf("FAIL\n"); \
            failed++; \
        } \
        total++; \
    } while(0)

#define TEST_SUMMARY() \
    do { \
        printf("\n===================================\n"); \
        printf("Results: %d total, %d passed, %d failed\n", total, passed, failed); \
    } while(0)

// Polls pred until it holds or timeoutSec elapses
inline bool waitUntil(const std::function<bool()>& pred, double timeoutSec = 5.0) {
    const auto end = std::chrono::steady_clock::now() + std::chrono::duration<double>(timeoutSec);
    while (std::chrono::steady_clock::now() < end) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return pred();
}
