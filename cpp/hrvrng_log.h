// Tagged printf-style logging. Define LOG_TAG before including.
#pragma once

#ifndef LOG_TAG
#define LOG_TAG "hrvrng"
#endif

#if defined(__ANDROID__)
#include <android/log.h>
#define HRVRNG_LOG_PRINT(prio, lvl, fmt, ...) __android_log_print(prio, LOG_TAG, fmt, ##__VA_ARGS__)
#define LOGI(fmt, ...) HRVRNG_LOG_PRINT(ANDROID_LOG_INFO, "I", fmt, ##__VA_ARGS__)
#define LOGW(fmt, ...) HRVRNG_LOG_PRINT(ANDROID_LOG_WARN, "W", fmt, ##__VA_ARGS__)
#define LOGE(fmt, ...) HRVRNG_LOG_PRINT(ANDROID_LOG_ERROR, "E", fmt, ##__VA_ARGS__)
#if defined(HRVRNG_VERBOSE)
#define LOGD(fmt, ...) HRVRNG_LOG_PRINT(ANDROID_LOG_DEBUG, "D", fmt, ##__VA_ARGS__)
#endif
#else
#include <cstdio>
#define HRVRNG_LOG_PRINT(prio, lvl, fmt, ...)                                                                      \
    do {                                                                                                           \
        std::fprintf(stderr, "[" LOG_TAG "] " lvl ": " fmt "\n", ##__VA_ARGS__);                                   \
        std::fflush(stderr);                                                                                       \
    } while (0)
#define LOGI(fmt, ...) HRVRNG_LOG_PRINT(0, "I", fmt, ##__VA_ARGS__)
#define LOGW(fmt, ...) HRVRNG_LOG_PRINT(0, "W", fmt, ##__VA_ARGS__)
#define LOGE(fmt, ...) HRVRNG_LOG_PRINT(0, "E", fmt, ##__VA_ARGS__)
#if defined(HRVRNG_VERBOSE)
#define LOGD(fmt, ...) HRVRNG_LOG_PRINT(0, "D", fmt, ##__VA_ARGS__)
#endif
#endif

#ifndef LOGD
#define LOGD(fmt, ...) do { } while (0)
#endif
