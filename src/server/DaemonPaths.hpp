#ifndef __PTYKEEP_DAEMON_PATHS__
#define __PTYKEEP_DAEMON_PATHS__

#include "Headers.hpp"

namespace ptykeep {
/**
 * A helper class to locate and prepare the daemon's state directory.
 *
 * The directory is `$PTYKEEP_HOME` when that is set to an absolute path, and
 * `$HOME/.ptykeep` otherwise. It holds the listening socket, the PID file and
 * the log directory.
 *
 * Anyone who can write to the directory can impersonate the daemon, so it is
 * created with mode 0700 and rejected unless it is a directory owned by the
 * current user without group/other write access.
 */
class DaemonPaths {
 public:
  /** @brief Resolves the base directory from the environment. */
  DaemonPaths();

  explicit DaemonPaths(const string& _baseDir);

  /**
   * @brief Creates the base directory if needed and checks its ownership and
   * permissions.
   * @throws DaemonError Io if the directory cannot be created or is unsafe.
   */
  void createDirectoriesIfRequired() const;

  /**
   * @brief Same checks for an arbitrary directory, e.g. the parent of a
   * socket path given on the command line.
   */
  static void ensurePrivateDirectory(const string& dir);

  const string& getBaseDir() const { return baseDir; }
  string getSocketPath() const { return baseDir + "/daemon.sock"; }
  string getPidPath() const { return baseDir + "/daemon.pid"; }
  string getLogDir() const { return baseDir + "/logs"; }

 private:
  string baseDir;
};
}  // namespace ptykeep

#endif  // __PTYKEEP_DAEMON_PATHS__
