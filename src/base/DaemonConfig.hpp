#ifndef __PTYKEEP_DAEMON_CONFIG__
#define __PTYKEEP_DAEMON_CONFIG__

#include "Headers.hpp"

namespace ptykeep {
/**
 * @brief Runtime settings of the daemon.
 *
 * Defaults are overridden by the `[Daemon]` section of an INI file and then
 * by command line flags.
 */
struct DaemonConfig {
  string socketPath;
  string pidPath;
  string logDir;
  // Per-session scrollback ring size in bytes
  size_t scrollbackBufferSize = 262144;
  // Chunks retained per session output channel before slow readers lag
  size_t broadcastCapacity = 64;
  uint16_t defaultRows = 24;
  uint16_t defaultCols = 80;
  int shutdownTimeoutSecs = 5;
  int verbose = 0;
  string maxLogSize = "20971520";

  /**
   * @brief Applies the `[Daemon]` section of `filename`. Keys that are absent
   * keep their current value.
   * @throws DaemonError ConfigInvalid when the file cannot be parsed or a
   * numeric value is malformed.
   */
  void loadIniFile(const string& filename);

  /** @brief Same as loadIniFile() for in-memory INI text. */
  void loadIniString(const string& contents);

  /** @throws DaemonError ConfigInvalid naming the first bad field. */
  void validate() const;
};
}  // namespace ptykeep

#endif  // __PTYKEEP_DAEMON_CONFIG__
