#include "SessionManager.hpp"

#include "DaemonError.hpp"
#include "TestHeaders.hpp"

using namespace ptykeep;

namespace {
CreateSessionRequest makeRequest(const string& sessionId, const string& command,
                                 const vector<string>& args) {
  CreateSessionRequest request;
  request.sessionId = sessionId;
  request.workingDirectory = "/tmp";
  request.command = command;
  request.args = args;
  return request;
}

DaemonErrorCode codeOf(std::function<void()> f) {
  try {
    f();
  } catch (const DaemonError& de) {
    return de.getCode();
  }
  FAIL("expected a DaemonError");
  return DaemonErrorCode::Io;
}

// Collects everything a receiver gets until `until` shows up or it closes.
string collect(BroadcastReceiver* receiver, const string& until) {
  string output;
  waitFor([&]() {
    auto result = receiver->recv(std::chrono::milliseconds(10));
    if (result.status == RecvStatus::Data) {
      output += result.data;
    }
    return result.status == RecvStatus::Closed ||
           output.find(until) != string::npos;
  });
  return output;
}
}  // namespace

TEST_CASE("SessionManager lifecycle", "[SessionManager]") {
  DaemonConfig config;
  auto exitQueue = make_shared<PtyExitQueue>();
  SessionManager manager(config, exitQueue);

  auto request = makeRequest("s1", "sleep", {"10"});
  request.projectId = string("proj");
  SessionInfo info = manager.createSession(request);
  REQUIRE(info.id == "s1");
  REQUIRE(info.status == "running");
  REQUIRE(info.ptyPid);
  REQUIRE(manager.getPtyManager().count() == 1);
  REQUIRE(manager.sessionCount() == 1);

  SECTION("Duplicate ids are rejected and the original keeps running") {
    REQUIRE(codeOf([&]() { manager.createSession(request); }) ==
            DaemonErrorCode::SessionAlreadyExists);
    REQUIRE(manager.getPtyManager().count() == 1);
    REQUIRE(manager.getSession("s1")->status == "running");
    REQUIRE(manager.getSession("s1")->ptyPid == info.ptyPid);
  }

  SECTION("stop keeps the record") {
    manager.stopSession("s1");
    auto stopped = manager.getSession("s1");
    REQUIRE(stopped);
    REQUIRE(stopped->status == "stopped");
    REQUIRE_FALSE(stopped->ptyPid);
    REQUIRE(manager.getPtyManager().count() == 0);
    REQUIRE(manager.listSessions(std::nullopt).size() == 1);
  }

  SECTION("destroy removes the record, twice is not found") {
    manager.destroySession("s1");
    REQUIRE_FALSE(manager.getSession("s1"));
    REQUIRE(manager.listSessions(std::nullopt).empty());
    REQUIRE(manager.getPtyManager().count() == 0);
    REQUIRE(codeOf([&]() { manager.destroySession("s1"); }) ==
            DaemonErrorCode::SessionNotFound);
  }

  SECTION("destroy after stop still succeeds") {
    manager.stopSession("s1");
    manager.destroySession("s1");
    REQUIRE_FALSE(manager.getSession("s1"));
  }

  SECTION("Project filter") {
    manager.createSession(makeRequest("s2", "sleep", {"10"}));
    REQUIRE(manager.listSessions(std::nullopt).size() == 2);
    auto filtered = manager.listSessions(string("proj"));
    REQUIRE(filtered.size() == 1);
    REQUIRE(filtered[0].id == "s1");
    REQUIRE(manager.listSessions(string("none")).empty());
  }

  manager.stopAll();
}

TEST_CASE("SessionManager failed create", "[SessionManager]") {
  DaemonConfig config;
  SessionManager manager(config, make_shared<PtyExitQueue>());

  REQUIRE(codeOf([&]() {
            manager.createSession(
                makeRequest("bad", "/nonexistent/ptykeep-binary", {}));
          }) == DaemonErrorCode::PtyError);
  REQUIRE(manager.getPtyManager().count() == 0);
  REQUIRE_FALSE(manager.getSession("bad"));
  REQUIRE(manager.sessionCount() == 0);
}

TEST_CASE("SessionManager unknown ids", "[SessionManager]") {
  DaemonConfig config;
  SessionManager manager(config, make_shared<PtyExitQueue>());
  string replay;
  REQUIRE(codeOf([&]() { manager.attachClient("nope", 1, &replay); }) ==
          DaemonErrorCode::SessionNotFound);
  REQUIRE(codeOf([&]() { manager.writeStdin("nope", "x"); }) ==
          DaemonErrorCode::SessionNotFound);
  REQUIRE(codeOf([&]() { manager.resizePty("nope", 10, 10); }) ==
          DaemonErrorCode::SessionNotFound);
  REQUIRE(codeOf([&]() { manager.stopSession("nope"); }) ==
          DaemonErrorCode::SessionNotFound);
  REQUIRE(codeOf([&]() { manager.scrollbackContents("nope"); }) ==
          DaemonErrorCode::SessionNotFound);
}

TEST_CASE("SessionManager attach streams output", "[SessionManager]") {
  DaemonConfig config;
  SessionManager manager(config, make_shared<PtyExitQueue>());
  manager.createSession(makeRequest("cat", "cat", {}));

  string replay;
  auto receiver = manager.attachClient("cat", 7, &replay);
  REQUIRE(manager.getSession("cat")->clientCount == uint64_t(1));

  manager.writeStdin("cat", "ping\n");
  string output = collect(&receiver, "ping");
  REQUIRE(output.find("ping") != string::npos);
  REQUIRE(waitFor([&]() {
    return manager.scrollbackContents("cat").find("ping") != string::npos;
  }));

  SECTION("A late attach replays the scrollback") {
    string lateReplay;
    auto late = manager.attachClient("cat", 8, &lateReplay);
    REQUIRE(lateReplay.find("ping") != string::npos);
    REQUIRE(manager.getSession("cat")->clientCount == uint64_t(2));
  }

  SECTION("detachClientFromAll") {
    manager.detachClientFromAll(7);
    REQUIRE(manager.getSession("cat")->clientCount == uint64_t(0));
  }

  SECTION("Stopped sessions refuse attach") {
    manager.stopSession("cat");
    REQUIRE(codeOf([&]() { manager.attachClient("cat", 9, &replay); }) ==
            DaemonErrorCode::SessionNotRunning);
  }

  manager.stopAll();
}

TEST_CASE("SessionManager applies child exits", "[SessionManager]") {
  DaemonConfig config;
  auto exitQueue = make_shared<PtyExitQueue>();
  SessionManager manager(config, exitQueue);
  manager.createSession(
      makeRequest("short", "/bin/sh", {"-c", "sleep 0.2; exit 3"}));
  auto receiver = manager.subscribeOutput("short");
  REQUIRE(receiver);
  // A passive subscription is not an attached client
  REQUIRE(manager.getSession("short")->clientCount == uint64_t(0));

  REQUIRE(waitFor([&]() { return manager.processExitEvents() > 0; }));
  auto info = manager.getSession("short");
  REQUIRE(info->status == "stopped");
  REQUIRE(info->exitCode == 3);
  REQUIRE(manager.getPtyManager().count() == 0);

  REQUIRE(waitFor([&]() {
    return receiver->recv(std::chrono::milliseconds(10)).status ==
           RecvStatus::Closed;
  }));

  // The pty is already gone, stopping reports it
  REQUIRE(codeOf([&]() { manager.stopSession("short"); }) ==
          DaemonErrorCode::SessionNotFound);
}

TEST_CASE("SessionManager ignores stale exit events", "[SessionManager]") {
  DaemonConfig config;
  auto exitQueue = make_shared<PtyExitQueue>();
  SessionManager manager(config, exitQueue);
  manager.createSession(makeRequest("s1", "sleep", {"10"}));

  PtyExitEvent stale;
  stale.sessionId = "s1";
  stale.readerId = 12345;
  stale.exitCode = 0;
  REQUIRE_FALSE(manager.handlePtyExit(stale));
  REQUIRE(manager.getSession("s1")->status == "running");

  manager.stopAll();
  REQUIRE(manager.getSession("s1")->status == "stopped");
}

TEST_CASE("Client ids are unique", "[SessionManager]") {
  DaemonConfig config;
  SessionManager manager(config, make_shared<PtyExitQueue>());
  auto a = manager.nextClientId();
  auto b = manager.nextClientId();
  REQUIRE(a != b);
}
