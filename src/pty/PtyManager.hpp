#ifndef __PTYKEEP_PTY_MANAGER__
#define __PTYKEEP_PTY_MANAGER__

#include "Headers.hpp"
#include "ManagedPty.hpp"

namespace ptykeep {
/**
 * @brief Owns the session id -> ManagedPty map.
 *
 * At most one PTY exists per session id; a second create for the same id is
 * rejected before any OS resource is allocated.
 */
class PtyManager {
 public:
  PtyManager();
  virtual ~PtyManager();

  /**
   * @brief Opens a PTY of the given size and spawns `command args...` on it.
   *
   * `command` is resolved against PATH (the one in `env` if present). The
   * child runs in `workingDir` with the daemon's environment plus `env`.
   * @throws DaemonError SessionAlreadyExists, or PtyError when the command
   * cannot be found or spawned. Nothing is recorded on failure.
   */
  shared_ptr<ManagedPty> create(const string& sessionId, const string& command,
                                const vector<string>& args,
                                const string& workingDir, uint16_t rows,
                                uint16_t cols,
                                const map<string, string>& env);

  /** @brief Returns the PTY for `sessionId`, or nullptr. */
  shared_ptr<ManagedPty> get(const string& sessionId);

  /**
   * @brief Kills the child and forgets the PTY.
   * @return The child's exit code if it could be collected.
   * @throws DaemonError SessionNotFound
   */
  optional<int> destroy(const string& sessionId);

  /**
   * @brief Forgets the PTY without killing the child, for processes that
   * already exited. Returns the removed record, or nullptr.
   */
  shared_ptr<ManagedPty> remove(const string& sessionId);

  size_t count();

  vector<string> sessionIds();

  /**
   * @brief Finds `command` the way execvp would.
   * @return The path to execute, or nullopt if nothing executable matches.
   */
  static optional<string> resolveExecutable(const string& command,
                                            const string& searchPath);

 protected:
  recursive_mutex ptyMutex;
  map<string, shared_ptr<ManagedPty>> ptys;
};
}  // namespace ptykeep

#endif  // __PTYKEEP_PTY_MANAGER__
