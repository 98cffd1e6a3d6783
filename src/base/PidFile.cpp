#include "PidFile.hpp"

#include "DaemonError.hpp"

namespace ptykeep {
void PidFile::write(const string& path) {
  fs::path pidPath(path);
  std::error_code ec;
  if (pidPath.has_parent_path()) {
    fs::create_directories(pidPath.parent_path(), ec);
    if (ec) {
      throw DaemonError::io("cannot create directory for " + path + ": " +
                            ec.message());
    }
  }

  int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
  if (fd == -1) {
    throw DaemonError::io("cannot open pid file " + path + ": " +
                          strerror(GetErrno()));
  }
  string pidString = to_string(::getpid()) + "\n";
  ssize_t written = ::write(fd, pidString.c_str(), pidString.length());
  auto localErrno = GetErrno();
  ::close(fd);
  if (written != ssize_t(pidString.length())) {
    throw DaemonError::io("cannot write pid file " + path + ": " +
                          strerror(localErrno));
  }
  VLOG(1) << "Wrote pid " << ::getpid() << " to " << path;
}

optional<pid_t> PidFile::read(const string& path) {
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    return nullopt;
  }
  ifstream in(path);
  if (!in.is_open()) {
    LOG(WARNING) << "Could not read pid file " << path;
    return nullopt;
  }
  string content;
  getline(in, content);
  size_t start = content.find_first_not_of(" \t\r");
  size_t end = content.find_last_not_of(" \t\r");
  if (start == string::npos) {
    LOG(WARNING) << "Empty pid file: " << path;
    return nullopt;
  }
  content = content.substr(start, end - start + 1);
  if (content.find_first_not_of("0123456789") != string::npos ||
      content.length() > 9) {
    LOG(WARNING) << "Invalid pid file " << path << ": " << content;
    return nullopt;
  }
  pid_t pid = pid_t(stol(content));
  if (pid <= 0) {
    LOG(WARNING) << "Invalid pid file " << path << ": " << content;
    return nullopt;
  }
  return pid;
}

void PidFile::remove(const string& path) {
  if (::unlink(path.c_str()) == -1 && GetErrno() != ENOENT) {
    throw DaemonError::io("cannot remove pid file " + path + ": " +
                          strerror(GetErrno()));
  }
}

bool PidFile::isProcessAlive(pid_t pid) {
  if (::kill(pid, 0) == 0) {
    return true;
  }
  return GetErrno() == EPERM;
}

optional<pid_t> PidFile::checkDaemonRunning(const string& path) {
  auto pid = read(path);
  if (!pid) {
    return nullopt;
  }
  if (isProcessAlive(*pid)) {
    return pid;
  }
  LOG(WARNING) << "Removing stale pid file " << path << " (pid " << *pid
               << " is gone)";
  try {
    remove(path);
  } catch (const DaemonError& e) {
    LOG(WARNING) << e.what();
  }
  return nullopt;
}
}  // namespace ptykeep
