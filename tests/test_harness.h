#pragma once

// Minimal registrar: TEST(name) bodies throw on the first failed assertion,
// RunAllTests() reports each test and returns the number of failures.

#include <functional>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace test_harness {

using TestFunc = std::function<void()>;

inline std::vector<std::pair<std::string, TestFunc>>& Registry() {
  static std::vector<std::pair<std::string, TestFunc>> tests;
  return tests;
}

inline void RegisterTest(const char* name, TestFunc func) { Registry().emplace_back(name, std::move(func)); }

[[noreturn]] inline void Fail(const char* file, int line, const std::string& what) {
  std::ostringstream oss;
  oss << file << ":" << line << ": " << what;
  throw std::runtime_error(oss.str());
}

inline int RunAllTests() {
  int failed = 0;
  for (const auto& [name, func] : Registry()) {
    try {
      func();
      std::cout << "[ PASS ] " << name << "\n";
    } catch (const std::exception& e) {
      failed++;
      std::cout << "[ FAIL ] " << name << "\n         " << e.what() << "\n";
    }
  }
  std::cout << Registry().size() - failed << "/" << Registry().size() << " passed" << std::endl;
  return failed;
}

}  // namespace test_harness

#define TEST(name)                                                                  \
  static void test_##name();                                                        \
  static struct TestRegistrar_##name {                                              \
    TestRegistrar_##name() { test_harness::RegisterTest(#name, test_##name); }      \
  } g_registrar_##name;                                                             \
  static void test_##name()

#define ASSERT_TRUE(expr)                                                           \
  do {                                                                              \
    if (!(expr)) test_harness::Fail(__FILE__, __LINE__, "ASSERT_TRUE failed: " #expr); \
  } while (0)

#define ASSERT_FALSE(expr)                                                          \
  do {                                                                              \
    if (expr) test_harness::Fail(__FILE__, __LINE__, "ASSERT_FALSE failed: " #expr); \
  } while (0)

#define ASSERT_EQ(a, b)                                                             \
  do {                                                                              \
    if (!((a) == (b))) test_harness::Fail(__FILE__, __LINE__, "ASSERT_EQ failed: " #a " != " #b); \
  } while (0)

#define ASSERT_NE(a, b)                                                             \
  do {                                                                              \
    if ((a) == (b)) test_harness::Fail(__FILE__, __LINE__, "ASSERT_NE failed: " #a " == " #b); \
  } while (0)
