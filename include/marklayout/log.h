#pragma once

/// Logging macros for the marklayout engine.
/// Android: uses __android_log_print
/// Other platforms: uses fprintf(stderr, ...)
///
/// ML_LOG_LEVEL sets the lowest level that is compiled in:
/// 0 = debug, 1 = info, 2 = warn, 3 = error.

#ifndef ML_LOG_LEVEL
#define ML_LOG_LEVEL 1
#endif

#ifdef __ANDROID__

#include <android/log.h>

#define ML_LOG_TAG "MarkLayout"
#define ML_LOG_IMPL_(prio, ...) __android_log_print(prio, ML_LOG_TAG, __VA_ARGS__)
#define ML_LOG_D_(...) ML_LOG_IMPL_(ANDROID_LOG_DEBUG, __VA_ARGS__)
#define ML_LOG_I_(...) ML_LOG_IMPL_(ANDROID_LOG_INFO,  __VA_ARGS__)
#define ML_LOG_W_(...) ML_LOG_IMPL_(ANDROID_LOG_WARN,  __VA_ARGS__)
#define ML_LOG_E_(...) ML_LOG_IMPL_(ANDROID_LOG_ERROR, __VA_ARGS__)

#else

#include <cstdio>

#define ML_LOG_D_(fmt, ...) fprintf(stderr, "[MarkLayout D] " fmt "\n", ##__VA_ARGS__)
#define ML_LOG_I_(fmt, ...) fprintf(stderr, "[MarkLayout I] " fmt "\n", ##__VA_ARGS__)
#define ML_LOG_W_(fmt, ...) fprintf(stderr, "[MarkLayout W] " fmt "\n", ##__VA_ARGS__)
#define ML_LOG_E_(fmt, ...) fprintf(stderr, "[MarkLayout E] " fmt "\n", ##__VA_ARGS__)

#endif

#define ML_LOG_NOOP_(...) ((void)0)

#if ML_LOG_LEVEL <= 0
#define ML_LOGD(...) ML_LOG_D_(__VA_ARGS__)
#else
#define ML_LOGD(...) ML_LOG_NOOP_(__VA_ARGS__)
#endif

#if ML_LOG_LEVEL <= 1
#define ML_LOGI(...) ML_LOG_I_(__VA_ARGS__)
#else
#define ML_LOGI(...) ML_LOG_NOOP_(__VA_ARGS__)
#endif

#if ML_LOG_LEVEL <= 2
#define ML_LOGW(...) ML_LOG_W_(__VA_ARGS__)
#else
#define ML_LOGW(...) ML_LOG_NOOP_(__VA_ARGS__)
#endif

#define ML_LOGE(...) ML_LOG_E_(__VA_ARGS__)
