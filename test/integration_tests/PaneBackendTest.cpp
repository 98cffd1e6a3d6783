#include "DaemonTestFixture.hpp"
#include "PaneBackendHandler.hpp"
#include "PaneBackendMessages.hpp"

using namespace ptykeep;

namespace {
json rpc(int id, const string& method, const json& params) {
  return {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
}

shared_ptr<TestClient> initialize(DaemonFixture& daemon,
                                  const string& leader = "leader") {
  auto client = daemon.connect();
  json response = client->request(rpc(
      1, "initialize", {{"protocol_version", "1"}, {"session_hint", leader}}));
  REQUIRE(response.contains("result"));
  return client;
}

int errorCodeOf(const json& response) {
  REQUIRE(response.contains("error"));
  return response["error"]["code"].get<int>();
}

class InspectablePaneBackendHandler : public PaneBackendHandler {
 public:
  using PaneBackendHandler::PaneBackendHandler;
  using PaneBackendHandler::handleLine;
  using PaneBackendHandler::handshake;

  size_t getRelayCount() const { return relays.size(); }
};

json responseFor(TestClient* client, int id) {
  auto response = client->waitFor(
      [id](const json& j) { return j.contains("id") && j["id"] == id; });
  REQUIRE(response);
  return *response;
}

bool isEventFor(const json& j, const string& method, const string& contextId) {
  return j.contains("method") && j["method"] == method &&
         j["params"]["context_id"] == contextId;
}
}  // namespace

TEST_CASE("Pane backend handshake", "[PaneBackend]") {
  DaemonFixture daemon;
  auto client = daemon.connect();

  json response = client->request(rpc(
      7, "initialize", {{"protocol_version", "1"}, {"session_hint", "main"}}));
  REQUIRE(response["id"] == 7);
  REQUIRE(response["result"]["protocol_version"] == "1");
  REQUIRE(response["result"]["self_context_id"] == "ctx_0");
  auto capabilities = response["result"]["capabilities"];
  REQUIRE(capabilities.is_array());
  REQUIRE(find(capabilities.begin(), capabilities.end(), "events") !=
          capabilities.end());

  json list = client->request(rpc(8, "list", json::object()));
  REQUIRE(list["result"]["contexts"] == json::array({"ctx_0"}));

  json again =
      client->request(rpc(9, "initialize", {{"protocol_version", "1"}}));
  REQUIRE(errorCodeOf(again) == PANE_ERROR_METHOD_NOT_FOUND);

  json unknown = client->request(rpc(10, "split_window", json::object()));
  REQUIRE(errorCodeOf(unknown) == PANE_ERROR_METHOD_NOT_FOUND);
}

TEST_CASE("Pane backend rejects other protocol versions", "[PaneBackend]") {
  DaemonFixture daemon;
  auto client = daemon.connect();
  client->send(rpc(1, "initialize", {{"protocol_version", "2"}}));
  REQUIRE(client->isClosed());
}

TEST_CASE("Pane backend requires initialize first", "[PaneBackend]") {
  DaemonFixture daemon;
  auto client = daemon.connect();
  client->send(rpc(1, "list", json::object()));
  REQUIRE(client->isClosed());
}

TEST_CASE("Pane backend parameter errors", "[PaneBackend]") {
  DaemonFixture daemon;
  auto client = initialize(daemon);

  json emptyCommand =
      client->request(rpc(2, "spawn_agent", {{"command", json::array()}}));
  REQUIRE(errorCodeOf(emptyCommand) == PANE_ERROR_INVALID_PARAMS);

  json list = client->request(rpc(3, "list", json::object()));
  REQUIRE(list["result"]["contexts"] == json::array({"ctx_0"}));

  json badWrite = client->request(
      rpc(4, "write", {{"context_id", "ctx_42"}, {"data", base64Encode("x")}}));
  REQUIRE(errorCodeOf(badWrite) == PANE_ERROR_INVALID_PARAMS);

  json badKill = client->request(rpc(5, "kill", {{"context_id", "ctx_42"}}));
  REQUIRE(errorCodeOf(badKill) == PANE_ERROR_INVALID_PARAMS);

  json badCapture =
      client->request(rpc(6, "capture", {{"context_id", "nope"}}));
  REQUIRE(errorCodeOf(badCapture) == PANE_ERROR_INVALID_PARAMS);

  // Lines that are not json objects are dropped without a reply
  client->sendRaw("{{{");
  json ping = client->request(rpc(7, "list", json::object()));
  REQUIRE(ping.contains("result"));
}

TEST_CASE("Pane backend spawns and relays a context", "[PaneBackend]") {
  DaemonFixture daemon;
  auto client = initialize(daemon, "lead");

  json spawned = client->request(rpc(
      2, "spawn_agent",
      {{"command", json::array({"cat"})}, {"cwd", "/tmp"}}));
  REQUIRE(spawned["result"]["context_id"] == "ctx_1");

  json list = client->request(rpc(3, "list", json::object()));
  REQUIRE(list["result"]["contexts"] == json::array({"ctx_0", "ctx_1"}));

  json written = client->request(rpc(
      4, "write",
      {{"context_id", "ctx_1"}, {"data", base64Encode("pane-line\n")}}));
  REQUIRE(written.contains("result"));

  string output;
  auto event = client->waitFor([&output](const json& j) {
    if (!isEventFor(j, "context_output", "ctx_1")) {
      return false;
    }
    output += decodeBase64(j["params"]["data"]);
    return output.find("pane-line") != string::npos;
  });
  REQUIRE(event);

  json captured = client->request(
      rpc(5, "capture", {{"context_id", "ctx_1"}, {"lines", 1}}));
  string tail = decodeBase64(captured["result"]["data"]);
  REQUIRE(tail.find('\n') == string::npos);

  // The child is an ordinary session grouped under its leader
  auto observer = daemon.connect();
  json sessions = observer->request(
      {{"type", "list_sessions"}, {"id", "l1"}, {"project_id", "lead"}});
  REQUIRE(sessions["sessions"].size() == 1);
  REQUIRE(sessions["sessions"][0]["id"] == "lead_ctx_1");

  json killed = client->request(rpc(6, "kill", {{"context_id", "ctx_1"}}));
  REQUIRE(killed.contains("result"));
  list = client->request(rpc(7, "list", json::object()));
  REQUIRE(list["result"]["contexts"] == json::array({"ctx_0"}));

  // Context ids are never handed out twice
  spawned = client->request(
      rpc(8, "spawn_agent", {{"command", json::array({"cat"})}}));
  REQUIRE(spawned["result"]["context_id"] == "ctx_2");
}

TEST_CASE("Pane backend reports context exit", "[PaneBackend]") {
  DaemonFixture daemon;
  auto client = initialize(daemon);

  json spawned = client->request(
      rpc(2, "spawn_agent",
          {{"command", json::array({"/bin/sh", "-c", "sleep 0.2; exit 2"})}}));
  REQUIRE(spawned["result"]["context_id"] == "ctx_1");

  auto exited = client->waitFor(
      [](const json& j) { return isEventFor(j, "context_exited", "ctx_1"); });
  REQUIRE(exited);
  REQUIRE((*exited)["params"]["exit_code"] == 2);

  // Killing an exited context still succeeds
  json killed = client->request(rpc(3, "kill", {{"context_id", "ctx_1"}}));
  REQUIRE(killed.contains("result"));
}

TEST_CASE("Pane backend and line clients share a daemon", "[PaneBackend]") {
  DaemonFixture daemon;
  auto pane = initialize(daemon);
  auto client = daemon.connect();

  REQUIRE(client->request({{"type", "ping"}, {"id", "p1"}})["type"] == "ack");
  REQUIRE(pane->request(rpc(2, "list", json::object())).contains("result"));
}

TEST_CASE("Connections without a leader get distinct child sessions",
          "[PaneBackend]") {
  DaemonFixture daemon;
  auto first = daemon.connect();
  auto second = daemon.connect();
  REQUIRE(first->request(rpc(1, "initialize", {{"protocol_version", "1"}}))
              .contains("result"));
  REQUIRE(second->request(rpc(1, "initialize", {{"protocol_version", "1"}}))
              .contains("result"));

  json spawned = first->request(
      rpc(2, "spawn_agent", {{"command", json::array({"cat"})}}));
  REQUIRE(spawned["result"]["context_id"] == "ctx_1");

  // ctx_1 would derive the session the first connection already owns
  spawned = second->request(
      rpc(2, "spawn_agent", {{"command", json::array({"cat"})}}));
  REQUIRE(spawned.contains("result"));
  REQUIRE(spawned["result"]["context_id"] == "ctx_2");

  json list = second->request(rpc(3, "list", json::object()));
  REQUIRE(list["result"]["contexts"] == json::array({"ctx_2"}));

  auto observer = daemon.connect();
  json sessions = observer->request({{"type", "list_sessions"}, {"id", "l1"}});
  set<string> ids;
  for (const auto& session : sessions["sessions"]) {
    ids.insert(session["id"].get<string>());
  }
  REQUIRE(ids == set<string>({"_ctx_1", "_ctx_2"}));
}

TEST_CASE("Pane backend releases relays of exited contexts",
          "[PaneBackend]") {
  HandlerFixture fixture;
  InspectablePaneBackendHandler handler(fixture.context, fixture.connection);
  TestClient* client = fixture.client.get();

  REQUIRE(handler.handshake(
      rpc(1, "initialize",
          {{"protocol_version", "1"}, {"session_hint", "reaper"}})
          .dump()));
  REQUIRE(responseFor(client, 1).contains("result"));

  const size_t CONTEXTS = 5;
  int id = 2;
  for (size_t i = 0; i < CONTEXTS; i++) {
    handler.handleLine(
        rpc(id, "spawn_agent", {{"command", json::array({"cat"})}}).dump());
    json spawned = responseFor(client, id++);
    string contextId = spawned["result"]["context_id"];

    handler.handleLine(rpc(id, "kill", {{"context_id", contextId}}).dump());
    REQUIRE(responseFor(client, id++).contains("result"));
  }
  REQUIRE(handler.getRelayCount() <= CONTEXTS);

  // Every relay ends once its channel closes and is dropped on the next line
  REQUIRE(waitFor([&]() {
    handler.handleLine(rpc(id, "list", json::object()).dump());
    json list = responseFor(client, id++);
    return list["result"]["contexts"] == json::array({"ctx_0"}) &&
           handler.getRelayCount() == 0;
  }));

  // Each killed context reported its exit before its relay went away
  for (size_t i = 1; i <= CONTEXTS; i++) {
    string contextId = ContextMap::contextIdForIndex(i);
    REQUIRE(client->waitFor([&contextId](const json& j) {
      return isEventFor(j, "context_exited", contextId);
    }));
  }
}

TEST_CASE("Killing a context whose session is gone unmaps it",
          "[PaneBackend]") {
  DaemonFixture daemon;
  auto client = initialize(daemon, "lead");
  json spawned = client->request(
      rpc(2, "spawn_agent", {{"command", json::array({"cat"})}}));
  REQUIRE(spawned["result"]["context_id"] == "ctx_1");

  auto other = daemon.connect();
  REQUIRE(other->request({{"type", "destroy_session"},
                          {"id", "d1"},
                          {"session_id", "lead_ctx_1"}})["type"] == "ack");

  json killed = client->request(rpc(3, "kill", {{"context_id", "ctx_1"}}));
  REQUIRE(killed.contains("result"));
  json list = client->request(rpc(4, "list", json::object()));
  REQUIRE(list["result"]["contexts"] == json::array({"ctx_0"}));

  // A second kill no longer resolves the context
  json again = client->request(rpc(5, "kill", {{"context_id", "ctx_1"}}));
  REQUIRE(errorCodeOf(again) == PANE_ERROR_INVALID_PARAMS);
}
