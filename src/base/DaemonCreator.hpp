#ifndef __PTYKEEP_DAEMON_CREATOR__
#define __PTYKEEP_DAEMON_CREATOR__

#include "Headers.hpp"

namespace ptykeep {
/**
 * @brief Detaches ptykeepd from the terminal that started it.
 */
class DaemonCreator {
 public:
  /**
   * @brief Double-forks into a new session, then points stdio at /dev/null,
   * moves to / and restricts the umask to the owner.
   *
   * Only the detached grandchild returns. The original process exits with
   * success once the first child exists, so a shell running
   * `ptykeepd --daemon` returns immediately.
   * @throws DaemonError Io when a fork or setsid fails in the original
   * process.
   */
  static void detach();
};
}  // namespace ptykeep

#endif  // __PTYKEEP_DAEMON_CREATOR__
