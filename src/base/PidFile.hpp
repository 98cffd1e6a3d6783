#ifndef __PTYKEEP_PID_FILE__
#define __PTYKEEP_PID_FILE__

#include "Headers.hpp"

namespace ptykeep {
/**
 * @brief Helpers for the file that records the running daemon's PID.
 */
class PidFile {
 public:
  /**
   * @brief Writes the current PID followed by a newline, creating parent
   * directories as needed.
   * @throws DaemonError Io
   */
  static void write(const string& path);

  /**
   * @brief Returns the recorded PID, or nullopt when the file is missing or
   * does not hold a number.
   */
  static optional<pid_t> read(const string& path);

  /**
   * @brief Removes the file. A missing file is not an error.
   * @throws DaemonError Io
   */
  static void remove(const string& path);

  /**
   * @brief Signal-0 probe. A process we may not signal (EPERM) still exists.
   */
  static bool isProcessAlive(pid_t pid);

  /**
   * @brief Returns the PID of a live daemon recorded at `path`. A PID file
   * left by a dead process is removed and nullopt returned.
   */
  static optional<pid_t> checkDaemonRunning(const string& path);
};
}  // namespace ptykeep

#endif  // __PTYKEEP_PID_FILE__
