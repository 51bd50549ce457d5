/// @file TestHarness.h
/// @brief Minimal test macros shared by the native unit tests
#pragma once

#include <cmath>
#include <cstdio>
#include <stdexcept>
#include <string>

// ============================================================================
// Test Helpers
// ============================================================================

static int testsPassed = 0;
static int testsFailed = 0;

struct AssertionFailure : std::runtime_error {
  explicit AssertionFailure(const std::string& what) : std::runtime_error(what) {}
};

inline void failAt(const char* file, int line, const char* expr) {
  char buf[512];
  std::snprintf(buf, sizeof(buf), "%s:%d: %s", file, line, expr);
  throw AssertionFailure(buf);
}

#define TEST(name) void test_##name()
#define RUN_TEST(name) do { \
  printf("Running %s... ", #name); \
  try { \
    test_##name(); \
    printf("PASSED\n"); \
    testsPassed++; \
  } catch (const std::exception& e) { \
    printf("FAILED\n    %s\n", e.what()); \
    testsFailed++; \
  } \
} while (0)

#define ASSERT_TRUE(x) do { if (!(x)) failAt(__FILE__, __LINE__, #x); } while (0)
#define ASSERT_FALSE(x) do { if (x) failAt(__FILE__, __LINE__, "!(" #x ")"); } while (0)
#define ASSERT_EQ(a, b) do { if (!((a) == (b))) failAt(__FILE__, __LINE__, #a " == " #b); } while (0)
#define ASSERT_NE(a, b) do { if (!((a) != (b))) failAt(__FILE__, __LINE__, #a " != " #b); } while (0)
#define ASSERT_NEAR(a, b, eps) do { \
  if (!(std::fabs(static_cast<double>(a) - static_cast<double>(b)) <= (eps))) \
    failAt(__FILE__, __LINE__, #a " ~= " #b); \
} while (0)

#define TEST_SUMMARY() ( \
  printf("\n=== Results: %d passed, %d failed ===\n\n", testsPassed, testsFailed), \
  testsFailed > 0 ? 1 : 0)
