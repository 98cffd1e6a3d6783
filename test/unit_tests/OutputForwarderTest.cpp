#include "OutputForwarder.hpp"

#include "TestHeaders.hpp"

using namespace ptykeep;

namespace {
// Records forwarder callbacks in the order they ran.
class ForwardLog {
 public:
  void add(const string& entry) {
    lock_guard<mutex> guard(logMutex);
    entries.push_back(entry);
  }

  vector<string> get() {
    lock_guard<mutex> guard(logMutex);
    return entries;
  }

 private:
  mutex logMutex;
  vector<string> entries;
};

shared_ptr<OutputForwarder> makeForwarder(BroadcastReceiver receiver,
                                          ForwardLog* log) {
  return make_shared<OutputForwarder>(
      "s1", std::move(receiver),
      [log](const string& data) { log->add("data:" + data); },
      [log](uint64_t bytes) { log->add("dropped:" + to_string(bytes)); },
      [log]() { log->add("closed"); });
}
}  // namespace

TEST_CASE("Forwarder reports dropped bytes before resuming",
          "[OutputForwarder]") {
  ForwardLog log;
  optional<BroadcastSender> sender(BroadcastSender(2));
  auto receiver = sender->subscribe();
  sender->send("aa");
  sender->send("bbb");
  sender->send("c");
  sender->send("dddd");

  auto forwarder = makeForwarder(std::move(receiver), &log);
  forwarder->start();
  REQUIRE(waitFor([&log]() { return log.get().size() == 3; }));
  REQUIRE_FALSE(forwarder->isFinished());

  sender.reset();
  REQUIRE(waitFor([&forwarder]() { return forwarder->isFinished(); }));
  forwarder->stop();
  REQUIRE(log.get() ==
          vector<string>({"dropped:5", "data:c", "data:dddd", "closed"}));
}

TEST_CASE("Stopped forwarders do not report closure", "[OutputForwarder]") {
  ForwardLog log;
  optional<BroadcastSender> sender(BroadcastSender(4));
  auto forwarder = makeForwarder(sender->subscribe(), &log);
  forwarder->start();

  sender->send("live");
  REQUIRE(waitFor([&log]() { return !log.get().empty(); }));
  forwarder->stop();
  REQUIRE(forwarder->isFinished());

  sender.reset();
  REQUIRE(log.get() == vector<string>({"data:live"}));
}
