#ifndef __PTYKEEP_CONTEXT_MAP__
#define __PTYKEEP_CONTEXT_MAP__

#include "Headers.hpp"

namespace ptykeep {
/**
 * @brief Bijection between the context ids of one pane-backend connection
 * and daemon session ids.
 *
 * `ctx_0` is reserved for the leader session and is only bound by
 * registerLeader(). allocate() hands out `ctx_1`, `ctx_2`, ... from a 64-bit
 * counter that never goes backwards, so an index is never handed out twice
 * on the same connection, even after its context is removed.
 */
class ContextMap {
 public:
  ContextMap();

  /** @brief Binds `ctx_0` to the leader session; allocation resumes at 1. */
  void registerLeader(const string& sessionId);

  /** @brief Binds the next context id to `sessionId` and returns it. */
  string allocate(const string& sessionId);

  /** @brief Index the next allocate() will use. */
  uint64_t peekNextIndex() const { return nextIndex; }

  /** @brief Burns the next index without binding anything. */
  void skipIndex() { nextIndex++; }

  optional<string> sessionFor(const string& ctxId) const;

  optional<string> ctxForSession(const string& sessionId) const;

  /**
   * @brief Removes both directions of a mapping.
   * @return The session id that was bound, or nullopt.
   */
  optional<string> removeCtx(const string& ctxId);

  /** @brief Every mapped context id, ordered by index. */
  vector<string> allCtxIds() const;

  optional<string> getLeaderSessionId() const { return sessionFor("ctx_0"); }

  size_t size() const { return ctxToSession.size(); }

  static string contextIdForIndex(uint64_t index) {
    return "ctx_" + to_string(index);
  }

 protected:
  void bind(const string& ctxId, const string& sessionId);

  uint64_t nextIndex;
  map<string, string> ctxToSession;
  map<string, string> sessionToCtx;
};
}  // namespace ptykeep

#endif  // __PTYKEEP_CONTEXT_MAP__
