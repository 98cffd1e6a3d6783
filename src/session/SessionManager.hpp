#ifndef __PTYKEEP_SESSION_MANAGER__
#define __PTYKEEP_SESSION_MANAGER__

#include "BroadcastChannel.hpp"
#include "DaemonConfig.hpp"
#include "DaemonSession.hpp"
#include "Headers.hpp"
#include "PtyExitQueue.hpp"
#include "PtyManager.hpp"
#include "PtyOutputReader.hpp"

namespace ptykeep {
/** @brief Everything needed to start a session. */
struct CreateSessionRequest {
  string sessionId;
  string workingDirectory;
  string command;
  vector<string> args;
  map<string, string> env;
  // Config defaults when unset
  optional<uint16_t> rows;
  optional<uint16_t> cols;
  optional<string> projectId;
  optional<string> agent;
  optional<string> note;
};

/**
 * @brief Owns every DaemonSession and the PtyManager, and performs all
 * multi-step lifecycle operations.
 *
 * The manager itself is not locked. DaemonContext guards it with a
 * reader/writer lock: const methods are queries and may share the lock,
 * everything else needs it exclusively.
 */
class SessionManager {
 public:
  SessionManager(const DaemonConfig& _config,
                 shared_ptr<PtyExitQueue> _exitQueue);
  virtual ~SessionManager();

  /**
   * @brief Spawns `request.command` on a new PTY and starts its reader.
   * @throws DaemonError SessionAlreadyExists, or PtyError. A failed create
   * leaves no session and no PTY behind.
   */
  SessionInfo createSession(const CreateSessionRequest& request);

  /**
   * @brief Marks `clientId` attached and returns a new output receiver.
   *
   * When `replay` is given it receives the scrollback, captured atomically
   * with the subscription: every byte is either in the replay or delivered
   * to the receiver, never both and never neither.
   * @throws DaemonError SessionNotFound or SessionNotRunning.
   */
  BroadcastReceiver attachClient(const string& sessionId, ClientId clientId,
                                 string* replay = nullptr);

  /**
   * @brief Subscribes to a session's output without counting as an attached
   * client.
   * @return nullopt when the session is no longer running.
   * @throws DaemonError SessionNotFound
   */
  optional<BroadcastReceiver> subscribeOutput(const string& sessionId);

  /** @throws DaemonError SessionNotFound */
  void detachClient(const string& sessionId, ClientId clientId);

  /** @throws DaemonError SessionNotFound if the session or PTY is gone. */
  void resizePty(const string& sessionId, uint16_t rows, uint16_t cols);

  /** @throws DaemonError SessionNotFound if the session or PTY is gone. */
  void writeStdin(const string& sessionId, const string& data);

  /**
   * @brief Kills the child and marks the session stopped. The session stays
   * listable.
   * @throws DaemonError SessionNotFound if the session or its PTY is gone.
   */
  void stopSession(const string& sessionId);

  /**
   * @brief Kills the child if it is still there, then forgets the session.
   * @throws DaemonError SessionNotFound
   */
  void destroySession(const string& sessionId);

  /**
   * @brief Handles a reader reporting EOF: drops the PTY record, records the
   * exit code and marks the session stopped.
   * @return The session's detached output sender, so the caller controls
   * when the channel closes. nullopt for stale events.
   */
  optional<BroadcastSender> handlePtyExit(const PtyExitEvent& event);

  /**
   * @brief Applies every queued PtyExitEvent and joins finished readers.
   * @return Number of events processed.
   */
  int processExitEvents();

  /** @brief All sessions ordered by id, optionally only one project's. */
  vector<SessionInfo> listSessions(const optional<string>& projectFilter) const;

  optional<SessionInfo> getSession(const string& sessionId) const;

  /** @throws DaemonError SessionNotFound */
  string scrollbackContents(const string& sessionId) const;

  /** @brief Detaches a client from every session, on connection teardown. */
  void detachClientFromAll(ClientId clientId);

  /**
   * @brief Stops every running session, logging failures and carrying on.
   */
  void stopAll();

  /** @brief Daemon-wide client id; safe without the manager lock. */
  ClientId nextClientId() { return clientIdCounter++; }

  size_t sessionCount() const { return sessions.size(); }

  PtyManager& getPtyManager() { return ptyManager; }

  const DaemonConfig& getConfig() const { return config; }

 protected:
  shared_ptr<DaemonSession> findSession(const string& sessionId) const;
  void retireReader(const string& sessionId);
  void reapReaders();

  DaemonConfig config;
  shared_ptr<PtyExitQueue> exitQueue;
  map<string, shared_ptr<DaemonSession>> sessions;
  PtyManager ptyManager;
  map<string, shared_ptr<PtyOutputReader>> readers;
  // Readers that were stopped or hit EOF and still need to be joined
  vector<shared_ptr<PtyOutputReader>> retiredReaders;
  atomic<ClientId> clientIdCounter;
  uint64_t readerIdCounter;
};
}  // namespace ptykeep

#endif  // __PTYKEEP_SESSION_MANAGER__
