/// @file Log.h
/// @brief Logging macros for examples only (NOT part of library)
#pragma once

#include <Arduino.h>

// Simple leveled logging over Serial for the examples.
// DO NOT use these in library code!

#ifndef EXAMPLE_LOG_LEVEL
#define EXAMPLE_LOG_LEVEL 3  // 0=error, 1=warn, 2=info, 3=debug
#endif

#define LOG_AT(level, tag, fmt, ...) do { \
  if (EXAMPLE_LOG_LEVEL >= (level)) { \
    Serial.printf("[%8lu][" tag "] " fmt "\n", static_cast<unsigned long>(millis()), ##__VA_ARGS__); \
  } \
} while (0)

#define LOGE(fmt, ...) LOG_AT(0, "E", fmt, ##__VA_ARGS__)
#define LOGW(fmt, ...) LOG_AT(1, "W", fmt, ##__VA_ARGS__)
#define LOGI(fmt, ...) LOG_AT(2, "I", fmt, ##__VA_ARGS__)
#define LOGD(fmt, ...) LOG_AT(3, "D", fmt, ##__VA_ARGS__)

// Conditional verbose logging
#define LOGV(verbose, fmt, ...) do { if (verbose) { Serial.printf("[V] " fmt "\n", ##__VA_ARGS__); } } while (0)
