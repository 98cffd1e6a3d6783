#include "DaemonCreator.hpp"

#include "DaemonError.hpp"

namespace ptykeep {
namespace {
void redirectToDevNull(int targetFd, int flags) {
  int fd = ::open("/dev/null", flags);
  FATAL_FAIL(fd);
  FATAL_FAIL(::dup2(fd, targetFd));
  if (fd != targetFd) {
    ::close(fd);
  }
}
}  // namespace

void DaemonCreator::detach() {
  pid_t pid = ::fork();
  if (pid < 0) {
    throw DaemonError::io(string("fork failed: ") + strerror(GetErrno()));
  }
  if (pid > 0) {
    ::_exit(EXIT_SUCCESS);
  }

  // From here on nothing is attached to the caller's terminal, so failures
  // can only go to the log
  if (::setsid() < 0) {
    STFATAL << "setsid failed: " << strerror(GetErrno());
  }
  ::signal(SIGHUP, SIG_IGN);

  pid = ::fork();
  if (pid < 0) {
    STFATAL << "second fork failed: " << strerror(GetErrno());
  }
  if (pid > 0) {
    // The grandchild can never reacquire a controlling terminal
    ::_exit(EXIT_SUCCESS);
  }

  ::umask(077);
  FATAL_FAIL(::chdir("/"));
  redirectToDevNull(STDIN_FILENO, O_RDONLY);
  redirectToDevNull(STDOUT_FILENO, O_WRONLY);
  redirectToDevNull(STDERR_FILENO, O_WRONLY);
}
}  // namespace ptykeep
