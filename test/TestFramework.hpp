/*****************************************************************
 * File:      TestFramework.hpp
 * Category:  test
 *
 * Purpose:
 *    Minimal self-registering test framework for the driver.
 *
 * Features:
 *    - Test case registration (REGISTER_TEST) per category
 *    - Assertion macros with line-level reporting
 *    - Per-test timing and a printed summary
 *****************************************************************/

#ifndef PANELSCAN_TEST_TEST_FRAMEWORK_HPP_
#define PANELSCAN_TEST_TEST_FRAMEWORK_HPP_

#include <chrono>
#include <math.h>
#include <stdint.h>
#include <stdio.h>
#include <string.h>

namespace panelscan::test{

// ============================================================
// Test Framework Constants
// ============================================================

constexpr int MAX_TESTS = 256;
constexpr int MAX_TEST_NAME = 64;
constexpr int MAX_MESSAGE = 256;

// ============================================================
// Test Result
// ============================================================

enum class TestStatus{
  NOT_RUN = 0,
  PASSED  = 1,
  FAILED  = 2,
  SKIPPED = 3
};

struct TestResult{
  TestStatus status;
  char name[MAX_TEST_NAME];
  char category[MAX_TEST_NAME];
  char message[MAX_MESSAGE];
  int assertions_passed;
  int assertions_failed;
  uint32_t duration_us;

  TestResult() : status(TestStatus::NOT_RUN), assertions_passed(0),
                 assertions_failed(0), duration_us(0){
    name[0] = '\0';
    category[0] = '\0';
    message[0] = '\0';
  }
};

typedef void (*TestFunction)();

struct TestCase{
  char name[MAX_TEST_NAME];
  char category[MAX_TEST_NAME];
  TestFunction func;

  TestCase() : func(nullptr){
    name[0] = '\0';
    category[0] = '\0';
  }
};

// ============================================================
// Test Context (assertion tracking)
// ============================================================

class TestContext{
public:
  static TestContext& instance(){
    static TestContext ctx;
    return ctx;
  }

  void beginTest(const TestCase& tc){
    current_ = TestResult();
    strncpy(current_.name, tc.name, MAX_TEST_NAME - 1);
    strncpy(current_.category, tc.category, MAX_TEST_NAME - 1);
    current_.status = TestStatus::PASSED;
    in_test_ = true;
  }

  void endTest(){ in_test_ = false; }

  void assertPass(){
    if(in_test_) current_.assertions_passed++;
  }

  void assertFail(const char* message){
    if(!in_test_) return;
    current_.assertions_failed++;
    current_.status = TestStatus::FAILED;
    if(current_.message[0] == '\0'){
      strncpy(current_.message, message, MAX_MESSAGE - 1);
    }
  }

  void setSkipped(const char* reason){
    if(!in_test_) return;
    current_.status = TestStatus::SKIPPED;
    strncpy(current_.message, reason, MAX_MESSAGE - 1);
  }

  TestResult& result(){ return current_; }

private:
  TestContext() : in_test_(false){}
  TestResult current_;
  bool in_test_;
};

// ============================================================
// Assertion Macros
// ============================================================

#define TEST_ASSERT(condition) \
  do{ \
    if(condition){ \
      ::panelscan::test::TestContext::instance().assertPass(); \
    }else{ \
      char msg_[256]; \
      snprintf(msg_, sizeof(msg_), "Assertion failed: %s (line %d)", #condition, __LINE__); \
      ::panelscan::test::TestContext::instance().assertFail(msg_); \
    } \
  }while(0)

#define TEST_ASSERT_MSG(condition, message) \
  do{ \
    if(condition){ \
      ::panelscan::test::TestContext::instance().assertPass(); \
    }else{ \
      ::panelscan::test::TestContext::instance().assertFail(message); \
    } \
  }while(0)

#define TEST_ASSERT_EQ(expected, actual) \
  do{ \
    if((expected) == (actual)){ \
      ::panelscan::test::TestContext::instance().assertPass(); \
    }else{ \
      char msg_[256]; \
      snprintf(msg_, sizeof(msg_), "Expected %lld, got %lld: %s (line %d)", \
               (long long)(expected), (long long)(actual), #actual, __LINE__); \
      ::panelscan::test::TestContext::instance().assertFail(msg_); \
    } \
  }while(0)

#define TEST_ASSERT_NEAR(expected, actual, tolerance) \
  do{ \
    double diff_ = fabs((double)(expected) - (double)(actual)); \
    if(diff_ <= (double)(tolerance)){ \
      ::panelscan::test::TestContext::instance().assertPass(); \
    }else{ \
      char msg_[256]; \
      snprintf(msg_, sizeof(msg_), "Expected %.3f, got %.3f (diff=%.3f, line %d)", \
               (double)(expected), (double)(actual), diff_, __LINE__); \
      ::panelscan::test::TestContext::instance().assertFail(msg_); \
    } \
  }while(0)

#define TEST_ASSERT_NOT_NULL(ptr) \
  TEST_ASSERT_MSG((ptr) != nullptr, "Expected non-null pointer: " #ptr)

#define TEST_ASSERT_NULL(ptr) \
  TEST_ASSERT_MSG((ptr) == nullptr, "Expected null pointer: " #ptr)

#define TEST_SKIP(reason) \
  do{ \
    ::panelscan::test::TestContext::instance().setSkipped(reason); \
    return; \
  }while(0)

// ============================================================
// Test Runner
// ============================================================

class TestRunner{
public:
  static TestRunner& instance(){
    static TestRunner runner;
    return runner;
  }

  bool registerTest(const char* name, const char* category, TestFunction func){
    if(test_count_ >= MAX_TESTS) return false;
    TestCase& tc = tests_[test_count_++];
    strncpy(tc.name, name, MAX_TEST_NAME - 1);
    strncpy(tc.category, category, MAX_TEST_NAME - 1);
    tc.func = func;
    return true;
  }

  /** Run every test whose category matches filter (all if null) */
  void run(const char* filter = nullptr){
    passed_ = failed_ = skipped_ = 0;
    results_count_ = 0;
    for(int i = 0; i < test_count_; i++){
      if(filter && strcmp(tests_[i].category, filter) != 0) continue;
      runTest(tests_[i]);
    }
  }

  void printSummary() const{
    printf("\n============================================\n");
    printf("Total:   %d tests\n", results_count_);
    printf("Passed:  %d\n", passed_);
    printf("Failed:  %d\n", failed_);
    printf("Skipped: %d\n", skipped_);
    printf("============================================\n");
    if(failed_ > 0){
      printf("\nFailed Tests:\n");
      for(int i = 0; i < results_count_; i++){
        if(results_[i].status == TestStatus::FAILED){
          printf("  - %s/%s: %s\n", results_[i].category, results_[i].name, results_[i].message);
        }
      }
    }
    printf("\n%s\n", failed_ == 0 ? "*** ALL TESTS PASSED ***" : "*** TESTS FAILED ***");
  }

  int testCount() const{ return test_count_; }
  int passedCount() const{ return passed_; }
  int failedCount() const{ return failed_; }
  int skippedCount() const{ return skipped_; }

private:
  TestRunner() : test_count_(0), results_count_(0), passed_(0), failed_(0), skipped_(0){}

  void runTest(const TestCase& tc){
    TestContext& ctx = TestContext::instance();
    ctx.beginTest(tc);

    const auto start = std::chrono::steady_clock::now();
    tc.func();
    const auto end = std::chrono::steady_clock::now();

    ctx.endTest();
    TestResult& r = ctx.result();
    r.duration_us = static_cast<uint32_t>(
      std::chrono::duration_cast<std::chrono::microseconds>(end - start).count());

    switch(r.status){
      case TestStatus::PASSED:
        passed_++;
        printf("  [PASS] %s/%s (%.2fms)\n", tc.category, tc.name, r.duration_us / 1000.0);
        break;
      case TestStatus::FAILED:
        failed_++;
        printf("  [FAIL] %s/%s: %s\n", tc.category, tc.name, r.message);
        break;
      case TestStatus::SKIPPED:
        skipped_++;
        printf("  [SKIP] %s/%s: %s\n", tc.category, tc.name, r.message);
        break;
      default:
        break;
    }

    if(results_count_ < MAX_TESTS){
      results_[results_count_++] = r;
    }
  }

  TestCase tests_[MAX_TESTS];
  int test_count_;
  TestResult results_[MAX_TESTS];
  int results_count_;
  int passed_;
  int failed_;
  int skipped_;
};

// Test registration macro
#define REGISTER_TEST(name, category) \
  static void test_##name(); \
  [[maybe_unused]] static bool test_registered_##name = \
    ::panelscan::test::TestRunner::instance().registerTest(#name, category, test_##name); \
  static void test_##name()

} // namespace panelscan::test

#endif // PANELSCAN_TEST_TEST_FRAMEWORK_HPP_
