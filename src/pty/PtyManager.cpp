#include "PtyManager.hpp"

#include "DaemonError.hpp"

extern char** environ;

namespace ptykeep {
namespace {
// How long destroy() waits for a killed child to be reaped
const int DESTROY_REAP_TIMEOUT_MS = 1000;

vector<string> buildEnvironment(const map<string, string>& overrides) {
  map<string, string> merged;
  for (char** e = environ; e != NULL && *e != NULL; e++) {
    string entry(*e);
    auto eq = entry.find('=');
    if (eq == string::npos) {
      continue;
    }
    merged[entry.substr(0, eq)] = entry.substr(eq + 1);
  }
  for (const auto& it : overrides) {
    merged[it.first] = it.second;
  }
  if (merged.find("TERM") == merged.end()) {
    merged["TERM"] = "xterm-256color";
  }
  vector<string> result;
  for (const auto& it : merged) {
    result.push_back(it.first + "=" + it.second);
  }
  return result;
}

vector<char*> toCharPointers(vector<string>& strings) {
  vector<char*> pointers;
  for (auto& s : strings) {
    pointers.push_back(&s[0]);
  }
  pointers.push_back(NULL);
  return pointers;
}
}  // namespace

PtyManager::PtyManager() {}

PtyManager::~PtyManager() {
  lock_guard<recursive_mutex> guard(ptyMutex);
  for (auto& it : ptys) {
    try {
      it.second->kill();
      it.second->getChild()->waitFor(
          std::chrono::milliseconds(DESTROY_REAP_TIMEOUT_MS));
    } catch (const DaemonError& de) {
      LOG(WARNING) << "Failed to kill " << it.first << ": " << de.what();
    }
  }
  ptys.clear();
}

optional<string> PtyManager::resolveExecutable(const string& command,
                                               const string& searchPath) {
  if (command.empty()) {
    return std::nullopt;
  }
  if (command.find('/') != string::npos) {
    if (::access(command.c_str(), X_OK) == 0) {
      return command;
    }
    return std::nullopt;
  }
  for (const auto& dir : split(searchPath, ':')) {
    string candidate = (dir.empty() ? string(".") : dir) + "/" + command;
    struct stat st;
    if (::stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
        ::access(candidate.c_str(), X_OK) == 0) {
      return candidate;
    }
  }
  return std::nullopt;
}

shared_ptr<ManagedPty> PtyManager::create(const string& sessionId,
                                          const string& command,
                                          const vector<string>& args,
                                          const string& workingDir,
                                          uint16_t rows, uint16_t cols,
                                          const map<string, string>& env) {
  lock_guard<recursive_mutex> guard(ptyMutex);
  if (ptys.find(sessionId) != ptys.end()) {
    throw DaemonError::sessionAlreadyExists(sessionId);
  }

  string searchPath = "/usr/local/bin:/usr/bin:/bin";
  auto pathOverride = env.find("PATH");
  if (pathOverride != env.end()) {
    searchPath = pathOverride->second;
  } else if (const char* p = ::getenv("PATH")) {
    searchPath = p;
  }
  auto executable = resolveExecutable(command, searchPath);
  if (!executable) {
    throw DaemonError::ptyError("command not found: " + command);
  }

  struct stat cwdStat;
  if (::stat(workingDir.c_str(), &cwdStat) != 0 || !S_ISDIR(cwdStat.st_mode)) {
    throw DaemonError::ptyError("working directory does not exist: " +
                                workingDir);
  }

  // Everything the child touches is prepared before fork(), the child only
  // makes async-signal-safe calls.
  vector<string> argvStrings;
  argvStrings.push_back(command);
  argvStrings.insert(argvStrings.end(), args.begin(), args.end());
  vector<char*> argv = toCharPointers(argvStrings);
  vector<string> envStrings = buildEnvironment(env);
  vector<char*> envp = toCharPointers(envStrings);
  string executablePath = *executable;

  // The child reports a failed chdir/exec through this pipe. A successful
  // exec closes it (O_CLOEXEC) and the parent reads EOF.
  int errorPipe[2];
  if (::pipe2(errorPipe, O_CLOEXEC) == -1) {
    throw DaemonError::ptyError("pipe failed: " + string(strerror(GetErrno())));
  }

  winsize ws;
  memset(&ws, 0, sizeof(ws));
  ws.ws_row = rows;
  ws.ws_col = cols;

  int masterFd = -1;
  pid_t pid = forkpty(&masterFd, NULL, NULL, &ws);
  if (pid == -1) {
    auto localErrno = GetErrno();
    ::close(errorPipe[0]);
    ::close(errorPipe[1]);
    throw DaemonError::ptyError("forkpty failed: " +
                                string(strerror(localErrno)));
  }
  if (pid == 0) {
    ::close(errorPipe[0]);
    int childErrno = 0;
    if (::chdir(workingDir.c_str()) == -1) {
      childErrno = errno;
    } else {
      // Programs such as shells expect default dispositions.
      ::signal(SIGCHLD, SIG_DFL);
      ::signal(SIGPIPE, SIG_DFL);
      ::signal(SIGINT, SIG_DFL);
      ::signal(SIGTERM, SIG_DFL);
      sigset_t allSignals;
      sigemptyset(&allSignals);
      ::sigprocmask(SIG_SETMASK, &allSignals, NULL);
      ::execve(executablePath.c_str(), argv.data(), envp.data());
      childErrno = errno;
    }
    ssize_t ignored = ::write(errorPipe[1], &childErrno, sizeof(childErrno));
    (void)ignored;
    ::_exit(127);
  }

  ::close(errorPipe[1]);
  int childErrno = 0;
  ssize_t bytesRead;
  do {
    bytesRead = ::read(errorPipe[0], &childErrno, sizeof(childErrno));
  } while (bytesRead == -1 && GetErrno() == EINTR);
  ::close(errorPipe[0]);

  auto child = make_shared<ChildProcess>(pid);
  if (bytesRead == sizeof(childErrno)) {
    child->wait();
    ::close(masterFd);
    throw DaemonError::ptyError("failed to spawn " + command + ": " +
                                strerror(childErrno));
  }
  FATAL_FAIL(::fcntl(masterFd, F_SETFD, FD_CLOEXEC));

  shared_ptr<ManagedPty> pty;
  try {
    pty = make_shared<ManagedPty>(sessionId, masterFd, child, rows, cols);
  } catch (const DaemonError& de) {
    child->kill();
    child->wait();
    throw;
  }
  ptys[sessionId] = pty;
  LOG(INFO) << "Spawned " << command << " (pid " << pid << ") for "
            << sessionId << " in " << workingDir << " at " << rows << "x"
            << cols;
  return pty;
}

shared_ptr<ManagedPty> PtyManager::get(const string& sessionId) {
  lock_guard<recursive_mutex> guard(ptyMutex);
  auto it = ptys.find(sessionId);
  if (it == ptys.end()) {
    return nullptr;
  }
  return it->second;
}

optional<int> PtyManager::destroy(const string& sessionId) {
  shared_ptr<ManagedPty> pty;
  {
    lock_guard<recursive_mutex> guard(ptyMutex);
    auto it = ptys.find(sessionId);
    if (it == ptys.end()) {
      throw DaemonError::sessionNotFound(sessionId);
    }
    pty = it->second;
    ptys.erase(it);
  }
  try {
    pty->kill();
  } catch (const DaemonError& de) {
    LOG(WARNING) << "Failed to kill pty child for " << sessionId << ": "
                 << de.what();
  }
  auto exitCode = pty->getChild()->waitFor(
      std::chrono::milliseconds(DESTROY_REAP_TIMEOUT_MS));
  if (!exitCode) {
    LOG(WARNING) << "Child " << pty->childProcessId() << " of " << sessionId
                 << " was not reaped after kill";
  }
  LOG(INFO) << "Destroyed pty for " << sessionId;
  return exitCode;
}

shared_ptr<ManagedPty> PtyManager::remove(const string& sessionId) {
  lock_guard<recursive_mutex> guard(ptyMutex);
  auto it = ptys.find(sessionId);
  if (it == ptys.end()) {
    return nullptr;
  }
  auto pty = it->second;
  ptys.erase(it);
  VLOG(1) << "Removed pty record for " << sessionId;
  return pty;
}

size_t PtyManager::count() {
  lock_guard<recursive_mutex> guard(ptyMutex);
  return ptys.size();
}

vector<string> PtyManager::sessionIds() {
  lock_guard<recursive_mutex> guard(ptyMutex);
  vector<string> ids;
  for (const auto& it : ptys) {
    ids.push_back(it.first);
  }
  return ids;
}
}  // namespace ptykeep
