#include "ClientMessages.hpp"

#include "DaemonError.hpp"
#include "TestHeaders.hpp"

using namespace ptykeep;

TEST_CASE("Parse create_session", "[ClientMessages]") {
  SECTION("Minimal request uses defaults") {
    auto message = parseClientMessage(
        R"({"type":"create_session","id":"r1","session_id":"s1",)"
        R"("working_directory":"/tmp","command":"bash"})");
    auto& m = std::get<CreateSessionMessage>(message);
    REQUIRE(m.id == "r1");
    REQUIRE(m.sessionId == "s1");
    REQUIRE(m.workingDirectory == "/tmp");
    REQUIRE(m.command == "bash");
    REQUIRE(m.args.empty());
    REQUIRE(m.envVars.empty());
    REQUIRE_FALSE(m.rows);
    REQUIRE_FALSE(m.useLoginShell);
    REQUIRE_FALSE(m.projectId);
    REQUIRE(messageTypeOf(message) == "create_session");
    REQUIRE(requestIdOf(message) == "r1");
  }

  SECTION("All fields") {
    auto message = parseClientMessage(
        R"({"type":"create_session","id":"r2","session_id":"s2",)"
        R"("working_directory":"/","command":"sh","args":["-c","true"],)"
        R"("env_vars":{"A":"1"},"rows":30,"cols":100,)"
        R"("use_login_shell":true,"project_id":"p","agent":"a","note":"n"})");
    auto& m = std::get<CreateSessionMessage>(message);
    REQUIRE(m.args == vector<string>{"-c", "true"});
    REQUIRE(m.envVars.at("A") == "1");
    REQUIRE(m.rows == uint16_t(30));
    REQUIRE(m.cols == uint16_t(100));
    REQUIRE(m.useLoginShell);
    REQUIRE(m.projectId == string("p"));
    REQUIRE(m.agent == string("a"));
    REQUIRE(m.note == string("n"));
  }
}

TEST_CASE("Optional fields are omitted on the wire", "[ClientMessages]") {
  CreateSessionMessage m;
  m.id = "r1";
  m.sessionId = "s1";
  m.workingDirectory = "/tmp";
  m.command = "bash";
  json j = clientMessageToJson(m);
  REQUIRE(j["type"] == "create_session");
  REQUIRE_FALSE(j.contains("rows"));
  REQUIRE_FALSE(j.contains("project_id"));
  REQUIRE_FALSE(j.contains("agent"));
  REQUIRE_FALSE(j.contains("use_login_shell"));

  ListSessionsMessage list{"r2", std::nullopt};
  REQUIRE_FALSE(clientMessageToJson(list).contains("project_id"));
  list.projectId = string("p");
  REQUIRE(clientMessageToJson(list)["project_id"] == "p");
}

TEST_CASE("Parse the simple requests", "[ClientMessages]") {
  auto attach = std::get<AttachMessage>(parseClientMessage(
      R"({"type":"attach","id":"1","session_id":"s","rows":24,"cols":80})"));
  REQUIRE(attach.rows == 24);
  REQUIRE(attach.cols == 80);

  auto write = std::get<WriteStdinMessage>(parseClientMessage(
      R"({"type":"write_stdin","id":"2","session_id":"s","data":"aGkK"})"));
  REQUIRE(write.data == "hi\n");

  auto destroy = std::get<DestroySessionMessage>(parseClientMessage(
      R"({"type":"destroy_session","id":"3","session_id":"s","force":true})"));
  REQUIRE(destroy.force);

  auto list = std::get<ListSessionsMessage>(parseClientMessage(
      R"({"type":"list_sessions","id":"4","project_id":"p"})"));
  REQUIRE(list.projectId == string("p"));

  REQUIRE(holds_alternative<PingMessage>(
      parseClientMessage(R"({"type":"ping","id":"5"})")));
  REQUIRE(holds_alternative<DaemonStopMessage>(
      parseClientMessage(R"({"type":"daemon_stop","id":"6"})")));
  REQUIRE(holds_alternative<ReadScrollbackMessage>(parseClientMessage(
      R"({"type":"read_scrollback","id":"7","session_id":"s"})")));
}

TEST_CASE("Malformed requests are protocol errors", "[ClientMessages]") {
  vector<string> bad = {
      "not json",
      "[1,2]",
      R"({"id":"1"})",
      R"({"type":"ping"})",
      R"({"type":"explode","id":"1"})",
      R"({"type":"attach","id":"1","session_id":"s","rows":70000,"cols":80})",
      R"({"type":"attach","id":"1","session_id":"s","rows":-1,"cols":80})",
      R"({"type":"write_stdin","id":"1","session_id":"s","data":"@@@"})",
      R"({"type":"create_session","id":"1","session_id":"s"})",
      R"({"type":"create_session","id":"1","session_id":"s",)"
      R"("working_directory":"/","command":"sh","args":[1]})",
  };
  for (const auto& line : bad) {
    INFO(line);
    try {
      parseClientMessage(line);
      FAIL("expected a protocol error");
    } catch (const DaemonError& de) {
      REQUIRE(de.getCode() == DaemonErrorCode::ProtocolError);
      REQUIRE(de.errorCode() == "protocol_error");
    }
  }
}

TEST_CASE("recoverRequestId", "[ClientMessages]") {
  REQUIRE(recoverRequestId(R"({"type":"explode","id":"abc"})") ==
          string("abc"));
  REQUIRE_FALSE(recoverRequestId("garbage"));
  REQUIRE_FALSE(recoverRequestId(R"({"id":5})"));
  REQUIRE_FALSE(recoverRequestId(R"({"type":"ping"})"));
}

TEST_CASE("Daemon messages encode as tagged objects", "[ClientMessages]") {
  json output = daemonMessageToJson(PtyOutputMessage{"s1", "hi\n"});
  REQUIRE(output["type"] == "pty_output");
  REQUIRE(output["data"] == "aGkK");
  REQUIRE_FALSE(output.contains("id"));

  json dropped = daemonMessageToJson(PtyOutputDroppedMessage{"s1", 42});
  REQUIRE(dropped["bytes_dropped"] == 42);

  json event = daemonMessageToJson(SessionEventMessage{"stopped", "s1", {}});
  REQUIRE(event["event"] == "stopped");
  REQUIRE_FALSE(event.contains("details"));

  json error = daemonMessageToJson(
      ErrorMessage{"r1", "session_not_found", "session not found: x"});
  REQUIRE(error["type"] == "error");
  REQUIRE(error["code"] == "session_not_found");

  REQUIRE(daemonMessageToJson(AckMessage{"r9"}) ==
          json({{"type", "ack"}, {"id", "r9"}}));
}

TEST_CASE("Daemon messages parse back", "[ClientMessages]") {
  SessionInfo info;
  info.id = "s1";
  info.workingDirectory = "/tmp";
  info.command = "bash";
  info.status = "running";
  info.createdAt = "2026-01-01T00:00:00.000Z";
  info.clientCount = 0;

  auto created = std::get<SessionCreatedMessage>(parseDaemonMessage(
      daemonMessageToJson(SessionCreatedMessage{"r1", info}).dump()));
  REQUIRE(created.session.id == "s1");
  REQUIRE(created.session.clientCount == uint64_t(0));
  REQUIRE_FALSE(created.session.ptyPid);

  auto event = std::get<SessionEventMessage>(
      parseDaemonMessage(daemonMessageToJson(
                             SessionEventMessage{"stopped", "s1",
                                                 json({{"exit_code", 3}})})
                             .dump()));
  REQUIRE((*event.details)["exit_code"] == 3);

  auto scrollback = std::get<ScrollbackContentsMessage>(parseDaemonMessage(
      daemonMessageToJson(ScrollbackContentsMessage{"r2", string("\0x", 2)})
          .dump()));
  REQUIRE(scrollback.data == string("\0x", 2));

  REQUIRE_THROWS_AS(parseDaemonMessage(R"({"type":"bogus"})"), DaemonError);
}
