#include "ContextMap.hpp"

namespace ptykeep {
namespace {
uint64_t indexOf(const string& ctxId) {
  // Ids that did not come from this map sort last
  if (ctxId.compare(0, 4, "ctx_") != 0) {
    return std::numeric_limits<uint64_t>::max();
  }
  try {
    return stoull(ctxId.substr(4));
  } catch (const std::logic_error&) {
    return std::numeric_limits<uint64_t>::max();
  }
}
}  // namespace

ContextMap::ContextMap() : nextIndex(1) {}

void ContextMap::bind(const string& ctxId, const string& sessionId) {
  // A session is reachable through one context at most
  auto existing = sessionToCtx.find(sessionId);
  if (existing != sessionToCtx.end()) {
    ctxToSession.erase(existing->second);
    sessionToCtx.erase(existing);
  }
  removeCtx(ctxId);
  ctxToSession[ctxId] = sessionId;
  sessionToCtx[sessionId] = ctxId;
}

void ContextMap::registerLeader(const string& sessionId) {
  bind(contextIdForIndex(0), sessionId);
  nextIndex = max(nextIndex, uint64_t(1));
}

string ContextMap::allocate(const string& sessionId) {
  string ctxId = contextIdForIndex(nextIndex++);
  bind(ctxId, sessionId);
  return ctxId;
}

optional<string> ContextMap::sessionFor(const string& ctxId) const {
  auto it = ctxToSession.find(ctxId);
  if (it == ctxToSession.end()) {
    return std::nullopt;
  }
  return it->second;
}

optional<string> ContextMap::ctxForSession(const string& sessionId) const {
  auto it = sessionToCtx.find(sessionId);
  if (it == sessionToCtx.end()) {
    return std::nullopt;
  }
  return it->second;
}

optional<string> ContextMap::removeCtx(const string& ctxId) {
  auto it = ctxToSession.find(ctxId);
  if (it == ctxToSession.end()) {
    return std::nullopt;
  }
  string sessionId = it->second;
  ctxToSession.erase(it);
  sessionToCtx.erase(sessionId);
  return sessionId;
}

vector<string> ContextMap::allCtxIds() const {
  vector<string> ids;
  for (const auto& it : ctxToSession) {
    ids.push_back(it.first);
  }
  sort(ids.begin(), ids.end(), [](const string& a, const string& b) {
    auto ia = indexOf(a);
    auto ib = indexOf(b);
    return ia != ib ? ia < ib : a < b;
  });
  return ids;
}
}  // namespace ptykeep
