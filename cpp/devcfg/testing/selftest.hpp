#pragma once
/*
  Selftest helpers

  Framework-free checks shared by the *_selftest executables:
    - each expectation prints "[ OK ]" or "[FAIL]" on stderr
    - exit_code() is non-zero when anything failed
*/

#include <exception>
#include <iostream>
#include <string>
#include <string_view>

namespace devcfg::selftest {

inline int g_fail_count = 0;

inline void fail(std::string_view msg) {
  ++g_fail_count;
  std::cerr << "[FAIL] " << msg << "\n";
}

inline void pass(std::string_view msg) {
  std::cerr << "[ OK ] " << msg << "\n";
}

inline void expect_true(bool v, std::string_view msg) {
  if (!v) fail(msg);
  else pass(msg);
}

inline void expect_eq_str(const std::string& a, const std::string& b, std::string_view msg) {
  if (a != b) {
    fail(msg);
    std::cerr << "  a: " << a << "\n";
    std::cerr << "  b: " << b << "\n";
  } else {
    pass(msg);
  }
}

template <class T>
void expect_eq(const T& a, const T& b, std::string_view msg) {
  if (!(a == b)) fail(msg);
  else pass(msg);
}

// Runs `fn` and expects it to throw E. Returns the caught message ("" if none).
template <class E, class Fn>
std::string expect_throws(Fn&& fn, std::string_view msg) {
  try {
    fn();
  } catch (const E& e) {
    pass(msg);
    return e.what();
  } catch (const std::exception& e) {
    fail(msg);
    std::cerr << "  unexpected exception: " << e.what() << "\n";
    return e.what();
  }
  fail(msg);
  std::cerr << "  no exception thrown\n";
  return {};
}

inline bool contains(const std::string& hay, std::string_view needle) {
  return hay.find(needle) != std::string::npos;
}

inline int exit_code() {
  if (g_fail_count > 0) {
    std::cerr << g_fail_count << " check(s) failed\n";
    return 1;
  }
  std::cerr << "all checks passed\n";
  return 0;
}

} // namespace devcfg::selftest
