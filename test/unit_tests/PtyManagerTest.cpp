#include "PtyManager.hpp"

#include "DaemonError.hpp"
#include "TestHeaders.hpp"

using namespace ptykeep;

namespace {
string readAvailable(int fd, const string& until, int timeoutMs = 5000) {
  string output;
  char buf[1024];
  waitFor(
      [&]() {
        while (waitOnSocketData(fd, 0)) {
          ssize_t rc = ::read(fd, buf, sizeof(buf));
          if (rc < 0 && GetErrno() == EAGAIN) {
            break;
          }
          if (rc <= 0) {
            return true;
          }
          output.append(buf, rc);
        }
        return output.find(until) != string::npos;
      },
      timeoutMs);
  return output;
}
}  // namespace

TEST_CASE("PtyManager spawns and tracks a child", "[PtyManager]") {
  PtyManager manager;
  auto pty = manager.create("s1", "sleep", {"10"}, "/tmp", 24, 80, {});
  REQUIRE(pty != nullptr);
  REQUIRE(pty->childProcessId() > 0);
  REQUIRE(manager.count() == 1);
  REQUIRE(manager.get("s1") == pty);
  REQUIRE(manager.get("other") == nullptr);
  REQUIRE(manager.sessionIds() == vector<string>{"s1"});

  SECTION("A second create for the same id fails") {
    try {
      manager.create("s1", "sleep", {"10"}, "/tmp", 24, 80, {});
      FAIL("expected SessionAlreadyExists");
    } catch (const DaemonError& de) {
      REQUIRE(de.getCode() == DaemonErrorCode::SessionAlreadyExists);
    }
    // The original child is untouched
    REQUIRE(manager.get("s1") == pty);
    REQUIRE_FALSE(pty->getChild()->hasExited());
  }

  SECTION("destroy kills and forgets the child") {
    manager.destroy("s1");
    REQUIRE(manager.count() == 0);
    REQUIRE(pty->getChild()->hasExited());
  }

  SECTION("remove forgets without killing") {
    auto removed = manager.remove("s1");
    REQUIRE(removed == pty);
    REQUIRE(manager.count() == 0);
    REQUIRE_FALSE(pty->getChild()->hasExited());
    pty->kill();
    pty->wait();
  }
}

TEST_CASE("PtyManager failed spawns leave no record", "[PtyManager]") {
  PtyManager manager;

  SECTION("Missing executable") {
    try {
      manager.create("bad", "/nonexistent/ptykeep-binary", {}, "/tmp", 24, 80,
                     {});
      FAIL("expected PtyError");
    } catch (const DaemonError& de) {
      REQUIRE(de.getCode() == DaemonErrorCode::PtyError);
      REQUIRE(string(de.what()).find("not found") != string::npos);
    }
  }

  SECTION("Missing working directory") {
    try {
      manager.create("bad", "sleep", {"1"}, "/nonexistent/ptykeep-dir", 24, 80,
                     {});
      FAIL("expected PtyError");
    } catch (const DaemonError& de) {
      REQUIRE(de.getCode() == DaemonErrorCode::PtyError);
      REQUIRE(string(de.what()).find("working directory") != string::npos);
    }
  }

  REQUIRE(manager.count() == 0);
  REQUIRE(manager.get("bad") == nullptr);
}

TEST_CASE("PtyManager destroy of unknown id", "[PtyManager]") {
  PtyManager manager;
  REQUIRE_THROWS_AS(manager.destroy("nope"), DaemonError);
  REQUIRE(manager.remove("nope") == nullptr);
}

TEST_CASE("ManagedPty echoes stdin through cat", "[PtyManager]") {
  PtyManager manager;
  auto pty = manager.create("cat", "cat", {}, "/tmp", 24, 80, {});
  int readerFd = pty->tryCloneReader();
  REQUIRE(readerFd >= 0);

  pty->writeStdin("hello pty\n");
  string output = readAvailable(readerFd, "hello pty");
  REQUIRE(output.find("hello pty") != string::npos);

  ::close(readerFd);
  manager.destroy("cat");
}

TEST_CASE("ManagedPty environment and size", "[PtyManager]") {
  PtyManager manager;
  auto pty = manager.create(
      "env", "/bin/sh",
      {"-c", "echo VAR=$PTYKEEP_TEST_VAR; stty size; sleep 10"}, "/tmp", 30,
      100, {{"PTYKEEP_TEST_VAR", "present"}});
  REQUIRE(pty->getSize() == make_pair(uint16_t(30), uint16_t(100)));
  int readerFd = pty->tryCloneReader();
  string output = readAvailable(readerFd, "30 100");
  REQUIRE(output.find("VAR=present") != string::npos);
  REQUIRE(output.find("30 100") != string::npos);

  pty->resize(40, 120);
  REQUIRE(pty->getSize() == make_pair(uint16_t(40), uint16_t(120)));

  ::close(readerFd);
  manager.destroy("env");
}

TEST_CASE("resolveExecutable searches the path", "[PtyManager]") {
  REQUIRE(PtyManager::resolveExecutable("sh", "/nonexistent:/bin") ==
          string("/bin/sh"));
  REQUIRE_FALSE(PtyManager::resolveExecutable("sh", "/nonexistent"));
  REQUIRE(PtyManager::resolveExecutable("/bin/sh", "") == string("/bin/sh"));
  REQUIRE_FALSE(PtyManager::resolveExecutable("", "/bin"));
}
