#include "DaemonServer.hpp"

#include "ClientConnectionHandler.hpp"
#include "DaemonError.hpp"
#include "JsonLib.hpp"
#include "PaneBackendHandler.hpp"
#include "PidFile.hpp"

namespace ptykeep {
namespace {
volatile sig_atomic_t shutdownSignalReceived = 0;

void ShutdownSignalHandler(int signum) { shutdownSignalReceived = 1; }
}  // namespace

DaemonServer::DaemonServer(shared_ptr<DaemonContext> _context,
                           shared_ptr<SocketHandler> _socketHandler)
    : context(_context),
      socketHandler(_socketHandler),
      listening(false),
      ownsPidFile(false) {
  endpoint.set_name(context->getConfig().socketPath);
}

DaemonServer::~DaemonServer() {
  context->requestShutdown();
  reapConnectionThreads(true);
  cleanup();
}

void DaemonServer::installSignalHandlers() {
  struct sigaction action;
  memset(&action, 0, sizeof(action));
  action.sa_handler = ShutdownSignalHandler;
  sigemptyset(&action.sa_mask);
  FATAL_FAIL(sigaction(SIGINT, &action, NULL));
  FATAL_FAIL(sigaction(SIGTERM, &action, NULL));
  // Writes to a vanished client must fail with EPIPE instead
  ::signal(SIGPIPE, SIG_IGN);
}

bool DaemonServer::isPaneBackendLine(const string& firstLine) {
  json j = json::parse(firstLine, nullptr, false);
  return !j.is_discarded() && j.is_object() && j.contains("method");
}

void DaemonServer::listen() {
  const string& pidPath = context->getConfig().pidPath;
  if (!pidPath.empty()) {
    auto existing = PidFile::checkDaemonRunning(pidPath);
    if (existing && *existing != ::getpid()) {
      throw DaemonError::alreadyRunning(*existing);
    }
  }

  socketHandler->listen(endpoint);
  listening = true;

  if (!pidPath.empty()) {
    PidFile::write(pidPath);
    ownsPidFile = true;
  }
  LOG(INFO) << "Daemon " << ::getpid() << " listening on " << endpoint;
}

void DaemonServer::run() {
  if (!listening) {
    listen();
  }
  set<int> serverFds = socketHandler->getEndpointFds(endpoint);
  fd_set coreFds;
  int maxCoreFd = 0;
  FD_ZERO(&coreFds);
  for (int i : serverFds) {
    FD_SET(i, &coreFds);
    maxCoreFd = max(maxCoreFd, i);
  }

  while (!context->isShuttingDown()) {
    if (shutdownSignalReceived) {
      LOG(INFO) << "Got a shutdown signal";
      context->requestShutdown();
      break;
    }
    context->processExitEvents();
    reapConnectionThreads(false);

    fd_set rfds = coreFds;
    timeval tv;
    tv.tv_sec = 0;
    tv.tv_usec = 10000;
    int numFdsSet = select(maxCoreFd + 1, &rfds, NULL, NULL, &tv);
    if (numFdsSet == -1 && GetErrno() == EINTR) {
      continue;
    }
    FATAL_FAIL(numFdsSet);
    if (numFdsSet == 0) {
      continue;
    }

    for (int i : serverFds) {
      if (FD_ISSET(i, &rfds)) {
        acceptNewConnection(i);
      }
    }
  }

  LOG(INFO) << "Shutting down";
  socketHandler->stopListening(endpoint);
  listening = false;

  {
    // Closing the output channels lets every forwarder finish
    auto lock = context->writeLock();
    context->getSessionManager().stopAll();
  }

  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::seconds(context->getConfig().shutdownTimeoutSecs);
  while (true) {
    reapConnectionThreads(false);
    {
      lock_guard<mutex> guard(connectionThreadMutex);
      if (connectionThreads.empty()) {
        break;
      }
    }
    if (std::chrono::steady_clock::now() > deadline) {
      LOG(WARNING) << "Connections still open after "
                   << context->getConfig().shutdownTimeoutSecs
                   << "s, waiting for them to finish";
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  reapConnectionThreads(true);
  context->processExitEvents();
  cleanup();
  LOG(INFO) << "Daemon stopped";
}

void DaemonServer::acceptNewConnection(int listenFd) {
  int clientFd = socketHandler->accept(listenFd);
  if (clientFd < 0) {
    return;
  }
  VLOG(1) << "Accepted connection on fd " << clientFd;
  auto finished = make_shared<atomic<bool>>(false);
  auto t = make_shared<std::thread>([this, clientFd, finished]() {
    handleConnection(clientFd);
    *finished = true;
  });
  lock_guard<mutex> guard(connectionThreadMutex);
  connectionThreads.push_back(ConnectionThread{t, finished});
}

void DaemonServer::handleConnection(int clientFd) {
  el::Helpers::setThreadName(string("conn-") + to_string(clientFd));
  auto connection = make_shared<LineConnection>(socketHandler, clientFd);

  string firstLine;
  while (!context->isShuttingDown()) {
    int rc = connection->readLine(&firstLine, 10 * 1000);
    if (rc < 0) {
      VLOG(1) << "Connection " << clientFd << " closed before any request";
      connection->close();
      return;
    }
    if (rc > 0 && firstLine.find_first_not_of(" \t\r") != string::npos) {
      break;
    }
  }
  if (context->isShuttingDown()) {
    connection->close();
    return;
  }

  if (isPaneBackendLine(firstLine)) {
    PaneBackendHandler handler(context, connection);
    handler.run(firstLine);
  } else {
    ClientConnectionHandler handler(context, connection);
    handler.run(firstLine);
  }
  connection->close();
}

void DaemonServer::reapConnectionThreads(bool wait) {
  vector<ConnectionThread> toJoin;
  {
    lock_guard<mutex> guard(connectionThreadMutex);
    auto it = connectionThreads.begin();
    while (it != connectionThreads.end()) {
      if (wait || *(it->finished)) {
        toJoin.push_back(*it);
        it = connectionThreads.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto& connectionThread : toJoin) {
    connectionThread.thread->join();
  }
}

void DaemonServer::cleanup() {
  if (listening) {
    socketHandler->stopListening(endpoint);
    listening = false;
  }
  if (ownsPidFile) {
    try {
      PidFile::remove(context->getConfig().pidPath);
    } catch (const DaemonError& de) {
      LOG(WARNING) << de.what();
    }
    ownsPidFile = false;
  }
}
}  // namespace ptykeep
