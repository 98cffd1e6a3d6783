#include "DaemonPaths.hpp"

#include "DaemonError.hpp"
#include "TestHeaders.hpp"

using namespace ptykeep;

namespace {
class ScopedEnv {
 public:
  ScopedEnv(const char* _name, const char* value) : name(_name) {
    const char* old = getenv(name.c_str());
    if (old) {
      previous = string(old);
    }
    if (value) {
      setenv(name.c_str(), value, 1);
    } else {
      unsetenv(name.c_str());
    }
  }

  ~ScopedEnv() {
    if (previous) {
      setenv(name.c_str(), previous->c_str(), 1);
    } else {
      unsetenv(name.c_str());
    }
  }

 private:
  string name;
  optional<string> previous;
};
}  // namespace

TEST_CASE("DaemonPaths resolves the base directory", "[DaemonPaths]") {
  SECTION("PTYKEEP_HOME wins") {
    ScopedEnv home("PTYKEEP_HOME", "/srv/ptykeep");
    DaemonPaths paths;
    REQUIRE(paths.getBaseDir() == "/srv/ptykeep");
    REQUIRE(paths.getSocketPath() == "/srv/ptykeep/daemon.sock");
    REQUIRE(paths.getPidPath() == "/srv/ptykeep/daemon.pid");
    REQUIRE(paths.getLogDir() == "/srv/ptykeep/logs");
  }

  SECTION("Falls back to HOME") {
    ScopedEnv ptykeepHome("PTYKEEP_HOME", nullptr);
    ScopedEnv home("HOME", "/home/someone");
    REQUIRE(DaemonPaths().getBaseDir() == "/home/someone/.ptykeep");
  }

  SECTION("Relative PTYKEEP_HOME is ignored") {
    ScopedEnv ptykeepHome("PTYKEEP_HOME", "relative/dir");
    ScopedEnv home("HOME", "/home/someone");
    REQUIRE(DaemonPaths().getBaseDir() == "/home/someone/.ptykeep");
  }

  SECTION("No usable home") {
    ScopedEnv ptykeepHome("PTYKEEP_HOME", nullptr);
    ScopedEnv home("HOME", nullptr);
    REQUIRE_THROWS_AS(DaemonPaths(), DaemonError);
  }
}

TEST_CASE("DaemonPaths creates private directories", "[DaemonPaths]") {
  TempDirectory dir;
  string base = dir.getPath() + "/state";
  DaemonPaths paths(base);
  paths.createDirectoriesIfRequired();

  struct stat st;
  REQUIRE(::stat(base.c_str(), &st) == 0);
  REQUIRE(S_ISDIR(st.st_mode));
  REQUIRE((st.st_mode & 0777) == 0700);
  REQUIRE(fs::is_directory(paths.getLogDir()));

  // Running again on an existing directory is fine
  REQUIRE_NOTHROW(paths.createDirectoriesIfRequired());

  SECTION("Group writable directories are rejected") {
    REQUIRE(::chmod(base.c_str(), 0770) == 0);
    REQUIRE_THROWS_AS(DaemonPaths::ensurePrivateDirectory(base), DaemonError);
  }

  SECTION("A file in the way is rejected") {
    string file = dir.getPath() + "/file";
    ofstream(file) << "x";
    REQUIRE_THROWS_AS(DaemonPaths::ensurePrivateDirectory(file), DaemonError);
  }
}
