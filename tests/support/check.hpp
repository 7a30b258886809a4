#pragma once
#include <iostream>
#include <string>

namespace tc_test {

inline int& failures() { static int n = 0; return n; }

inline void check(bool ok, const std::string& what) {
  if (ok) {
    std::cout << "[PASS] " << what << "\n";
  } else {
    std::cerr << "[FAIL] " << what << "\n";
    ++failures();
  }
}

inline int finish(const char* suite) {
  if (failures() == 0) {
    std::cout << "[PASS] " << suite << "\n";
    return 0;
  }
  std::cerr << "[FAIL] " << suite << ": " << failures() << " check(s) failed\n";
  return 1;
}

}
