#pragma once
#include <cstdio>

// 0: silent, 1: errors, 2: warnings, 3: info, 4: debug
#ifndef F1QP_LOG_LEVEL
#define F1QP_LOG_LEVEL 2
#endif

#define F1QP_LOG_AT(LVL, TAG, ...)                                   \
  do {                                                               \
    if (F1QP_LOG_LEVEL >= (LVL)) {                                   \
      std::fprintf(stderr, "[f1qp] " TAG " ");                       \
      std::fprintf(stderr, __VA_ARGS__);                             \
      std::fprintf(stderr, "\n");                                    \
    }                                                                \
  } while (0)

#define F1QP_LOG_ERROR(...) F1QP_LOG_AT(1, "ERROR", __VA_ARGS__)
#define F1QP_LOG_WARN(...)  F1QP_LOG_AT(2, "WARN ", __VA_ARGS__)
#define F1QP_LOG_INFO(...)  F1QP_LOG_AT(3, "INFO ", __VA_ARGS__)
#define F1QP_LOG_DEBUG(...) F1QP_LOG_AT(4, "DEBUG", __VA_ARGS__)
