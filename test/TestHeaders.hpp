#ifndef __PTYKEEP_TEST_HEADERS__
#define __PTYKEEP_TEST_HEADERS__

#include "Headers.hpp"
#include "JsonLib.hpp"
#include "catch2/catch.hpp"

namespace ptykeep {
// Polls `condition` every 10ms until it holds or `timeoutMs` passes.
template <typename F>
inline bool waitFor(F condition, int timeoutMs = 5000) {
  for (int waited = 0; waited < timeoutMs; waited += 10) {
    if (condition()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return condition();
}

// A private scratch directory, removed on destruction.
class TempDirectory {
 public:
  TempDirectory() {
    string pattern = GetTempDirectory() + string("ptykeep_test_XXXXXXXX");
    if (mkdtemp(&pattern[0]) == NULL) {
      throw std::runtime_error("mkdtemp failed");
    }
    path = pattern;
  }

  ~TempDirectory() {
    std::error_code ec;
    fs::remove_all(path, ec);
  }

  const string& getPath() const { return path; }

 private:
  string path;
};
}  // namespace ptykeep

#endif  // __PTYKEEP_TEST_HEADERS__
