#ifndef _UNITTEST_HELPER_H_
#define _UNITTEST_HELPER_H_

#include <cstdio>
#include <cstdlib>
#include <cstring>

#define COLOR_RED     "\x1b[31m"
#define COLOR_GREEN   "\x1b[32m"
#define COLOR_RESET   "\x1b[0m"

template<class T>
struct UNITTEST_HELPER {
  void call() {}
};

#define BTOS(b) ((b) ? "TRUE" : "FALSE")
#define PTRS(s) ((s).c_str())

/* aborts even with NDEBUG, a failed check must fail the run */
#define CHECK_IMPL(r, name, fmt, arg...) do {                        \
  if ((r)) break;                                                    \
  fprintf(stderr, "%s@%-5d %s -> [" COLOR_RED fmt COLOR_RESET "]\n", \
          name, __LINE__, #r, ##arg);                                \
  abort();                                                           \
} while(0)

#define check(r, fmt, arg...)  CHECK_IMPL(r, __FILE__, fmt, ##arg)
#define checkx(r, fmt, arg...) CHECK_IMPL(r, TEST_NAME_, fmt, ##arg)

#define DEFINE(func)  struct TEST_##func {};                        \
  template<> struct UNITTEST_HELPER<TEST_##func> {                  \
    UNITTEST_HELPER(const char *name) : TEST_NAME_(name) {}         \
    void call(); const char *TEST_NAME_; };                         \
  void UNITTEST_HELPER<TEST_##func>::call()

#define TEST_IMPL(func, name, t) do {                                    \
  UNITTEST_HELPER<TEST_##func> test_##func(name); test_##func.call();    \
  if (t) printf("TEST %-60s [" COLOR_GREEN "OK" COLOR_RESET "]\n", name); \
} while(0)

#define DO(func)          TEST_IMPL(func, #func, false)
#define TEST(func)        TEST_IMPL(func, #func, true)
#define TESTX(func, name) TEST_IMPL(func, name, true)

#endif
