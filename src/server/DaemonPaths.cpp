#include "DaemonPaths.hpp"

#include "DaemonError.hpp"

namespace ptykeep {
namespace {
bool IsAbsolutePath(const string& path) {
  return (!path.empty() && path[0] == '/');
}

string ResolveBaseDir() {
  if (const char* home = getenv("PTYKEEP_HOME")) {
    if (IsAbsolutePath(home)) {
      return home;
    }
    LOG(WARNING) << "Ignoring relative $PTYKEEP_HOME: " << home;
  }
  const char* home = getenv("HOME");
  if (home == NULL || !IsAbsolutePath(home)) {
    throw DaemonError::configInvalid(
        "$HOME must be set to an absolute path (or set $PTYKEEP_HOME)");
  }
  return string(home) + "/.ptykeep";
}

void TryCreateDirectory(const string& dir, mode_t mode) {
  // Reset umask to 0 while creating the directory, and restore after.
  const mode_t oldMode = ::umask(0);
  int rc = ::mkdir(dir.c_str(), mode);
  auto localErrno = GetErrno();
  ::umask(oldMode);
  if (rc == -1 && localErrno != EEXIST) {
    throw DaemonError::io("cannot create " + dir + ": " +
                          strerror(localErrno));
  }
}
}  // namespace

DaemonPaths::DaemonPaths() : baseDir(ResolveBaseDir()) {}

DaemonPaths::DaemonPaths(const string& _baseDir) : baseDir(_baseDir) {}

void DaemonPaths::createDirectoriesIfRequired() const {
  ensurePrivateDirectory(baseDir);
  TryCreateDirectory(getLogDir(), 0700);
}

void DaemonPaths::ensurePrivateDirectory(const string& dir) {
  TryCreateDirectory(dir, 0700);

  struct stat dirStat;
  if (::stat(dir.c_str(), &dirStat) != 0) {
    throw DaemonError::io("cannot stat " + dir + ": " + strerror(GetErrno()));
  }

  if (!S_ISDIR(dirStat.st_mode)) {
    throw DaemonError::io("not a directory: " + dir);
  }

  if (dirStat.st_uid != ::geteuid()) {
    throw DaemonError::io("directory must be owned by the current user: " +
                          dir + " (expected uid " + to_string(::geteuid()) +
                          ", actual " + to_string(dirStat.st_uid) + ")");
  }

  // Fail if the folder has write permissions to group or other.
  if ((dirStat.st_mode & (S_IWGRP | S_IWOTH)) != 0) {
    throw DaemonError::io(
        "directory must not provide write access to group/other: " + dir);
  }
}
}  // namespace ptykeep
