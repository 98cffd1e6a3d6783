#include "DaemonConfig.hpp"

#include "DaemonError.hpp"
#include "TestHeaders.hpp"

using namespace ptykeep;

namespace {
DaemonConfig validConfig() {
  DaemonConfig config;
  config.socketPath = "/tmp/ptykeep-test.sock";
  return config;
}

void requireInvalid(const DaemonConfig& config, const string& field) {
  try {
    config.validate();
    FAIL("expected ConfigInvalid for " << field);
  } catch (const DaemonError& de) {
    REQUIRE(de.getCode() == DaemonErrorCode::ConfigInvalid);
    REQUIRE(string(de.what()).find(field) != string::npos);
  }
}
}  // namespace

TEST_CASE("DaemonConfig defaults", "[DaemonConfig]") {
  DaemonConfig config;
  REQUIRE(config.scrollbackBufferSize == 262144);
  REQUIRE(config.broadcastCapacity == 64);
  REQUIRE(config.defaultRows == 24);
  REQUIRE(config.defaultCols == 80);
  REQUIRE(config.shutdownTimeoutSecs == 5);
  REQUIRE(config.verbose == 0);
  REQUIRE_NOTHROW(validConfig().validate());
}

TEST_CASE("DaemonConfig validation", "[DaemonConfig]") {
  auto config = validConfig();
  SECTION("socket path") {
    config.socketPath = "";
    requireInvalid(config, "socket_path");
    config.socketPath = "/" + string(200, 'x');
    requireInvalid(config, "socket_path");
  }
  SECTION("scrollback") {
    config.scrollbackBufferSize = 0;
    requireInvalid(config, "scrollback_buffer_size");
  }
  SECTION("broadcast") {
    config.broadcastCapacity = 0;
    requireInvalid(config, "broadcast_capacity");
  }
  SECTION("size") {
    config.defaultCols = 0;
    requireInvalid(config, "default_cols");
  }
  SECTION("shutdown timeout") {
    config.shutdownTimeoutSecs = 0;
    requireInvalid(config, "shutdown_timeout_secs");
  }
}

TEST_CASE("DaemonConfig INI loading", "[DaemonConfig]") {
  auto config = validConfig();

  SECTION("Values override defaults, absent keys keep them") {
    config.loadIniString(
        "[Daemon]\n"
        "socket_path = /run/user/1/p.sock\n"
        "scrollback_buffer_size = 1024\n"
        "default_rows = 50\n"
        "verbose = 3\n"
        "logsize = 1048576\n"
        "[Other]\n"
        "default_cols = 7\n");
    REQUIRE(config.socketPath == "/run/user/1/p.sock");
    REQUIRE(config.scrollbackBufferSize == 1024);
    REQUIRE(config.defaultRows == 50);
    REQUIRE(config.defaultCols == 80);
    REQUIRE(config.verbose == 3);
    REQUIRE(config.maxLogSize == "1048576");
  }

  SECTION("Malformed numbers") {
    REQUIRE_THROWS_AS(config.loadIniString("[Daemon]\ndefault_rows = lots\n"),
                      DaemonError);
    REQUIRE_THROWS_AS(config.loadIniString("[Daemon]\ndefault_rows = 70000\n"),
                      DaemonError);
    REQUIRE_THROWS_AS(
        config.loadIniString("[Daemon]\nbroadcast_capacity = 12abc\n"),
        DaemonError);
  }

  SECTION("From a file") {
    TempDirectory dir;
    string path = dir.getPath() + "/ptykeep.ini";
    {
      ofstream out(path);
      out << "[Daemon]\nbroadcast_capacity = 8\n";
    }
    config.loadIniFile(path);
    REQUIRE(config.broadcastCapacity == 8);
    REQUIRE_THROWS_AS(config.loadIniFile(dir.getPath() + "/missing.ini"),
                      DaemonError);
  }
}
