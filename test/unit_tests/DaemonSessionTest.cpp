#include "DaemonSession.hpp"

#include "DaemonError.hpp"
#include "TestHeaders.hpp"

using namespace ptykeep;

namespace {
shared_ptr<DaemonSession> makeSession() {
  return make_shared<DaemonSession>("s1", "/tmp", "sleep",
                                    "2026-01-01T00:00:00.000Z", 1024);
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
}  // namespace

TEST_CASE("New sessions are creating", "[DaemonSession]") {
  auto session = makeSession();
  REQUIRE(session->getState() == SessionState::Creating);
  REQUIRE_FALSE(session->hasOutput());
  REQUIRE_FALSE(session->subscribeOutput());
  REQUIRE(session->toSessionInfo().status == "creating");
}

TEST_CASE("setRunning only from creating", "[DaemonSession]") {
  auto session = makeSession();
  BroadcastSender sender(4);

  session->setRunning(sender, 1234);
  REQUIRE(session->isRunning());
  REQUIRE(session->getPtyPid() == 1234);
  REQUIRE(session->hasOutput());

  REQUIRE(codeOf([&]() { session->setRunning(sender, 1); }) ==
          DaemonErrorCode::InvalidStateTransition);

  session->setStopped();
  REQUIRE(codeOf([&]() { session->setRunning(sender, 1); }) ==
          DaemonErrorCode::InvalidStateTransition);
}

TEST_CASE("setStopped is idempotent", "[DaemonSession]") {
  auto session = makeSession();
  BroadcastSender sender(4);
  session->setRunning(sender, 42);
  session->getScrollback()->push("kept");
  session->setExitCode(3);

  session->setStopped();
  REQUIRE(session->getState() == SessionState::Stopped);
  REQUIRE_NOTHROW(session->setStopped());
  REQUIRE(session->getState() == SessionState::Stopped);

  REQUIRE_FALSE(session->getPtyPid());
  REQUIRE_FALSE(session->hasOutput());
  REQUIRE(session->scrollbackContents() == "kept");
  REQUIRE(session->getExitCode() == 3);
}

TEST_CASE("setStopped from creating", "[DaemonSession]") {
  auto session = makeSession();
  session->setStopped();
  REQUIRE(session->getState() == SessionState::Stopped);
}

TEST_CASE("Stopping closes the output channel", "[DaemonSession]") {
  auto session = makeSession();
  {
    BroadcastSender sender(4);
    session->setRunning(sender, 42);
  }
  auto receiver = session->subscribeOutput();
  REQUIRE(receiver);
  session->setStopped();
  REQUIRE(receiver->tryRecv().status == RecvStatus::Closed);
  REQUIRE_FALSE(session->subscribeOutput());
}

TEST_CASE("Client bookkeeping", "[DaemonSession]") {
  auto session = makeSession();
  session->attachClient(1);
  session->attachClient(2);
  session->attachClient(1);
  REQUIRE(session->clientCount() == 2);
  session->detachClient(1);
  session->detachClient(7);
  REQUIRE(session->clientCount() == 1);
  REQUIRE(session->toSessionInfo().clientCount == uint64_t(1));
}

TEST_CASE("SessionInfo carries metadata", "[DaemonSession]") {
  auto session = makeSession();
  session->projectId = string("proj");
  session->note = string("n");
  BroadcastSender sender(4);
  session->setRunning(sender, 99);

  SessionInfo info = session->toSessionInfo();
  REQUIRE(info.id == "s1");
  REQUIRE(info.workingDirectory == "/tmp");
  REQUIRE(info.command == "sleep");
  REQUIRE(info.status == "running");
  REQUIRE(info.ptyPid == int64_t(99));
  REQUIRE(info.projectId == string("proj"));
  REQUIRE_FALSE(info.agent);

  json j = info;
  REQUIRE(j["pty_pid"] == 99);
  REQUIRE(j["project_id"] == "proj");
  REQUIRE_FALSE(j.contains("agent"));
  REQUIRE_FALSE(j.contains("exit_code"));
  REQUIRE(j.get<SessionInfo>().note == string("n"));
}
