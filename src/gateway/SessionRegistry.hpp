#ifndef __TG_SESSION_REGISTRY__
#define __TG_SESSION_REGISTRY__

#include "Headers.hpp"

namespace tg {
class SessionChannel;

/**
 * @brief The live connections of this process, grouped by Session
 * Identifier.
 *
 * Several connections may share an identifier (one pane open in two tabs);
 * each has its own Bridge attached to the same tmux session.  Entries only
 * exist while their connection is open and are never persisted.
 */
class SessionRegistry {
 public:
  void add(const string& sessionId, const string& connectionId,
           weak_ptr<SessionChannel> channel);

  /** @brief Removing an unknown entry does nothing. */
  void remove(const string& sessionId, const string& connectionId);

  int connectionCount(const string& sessionId) const;

  /** @brief Total number of open connections. */
  int size() const;

  /** @brief Identifiers with at least one open connection, sorted. */
  vector<string> sessionIds() const;

  /**
   * @brief Closes every registered connection.  Durable sessions are left
   * alone.
   */
  void closeAll();

 protected:
  map<string, map<string, weak_ptr<SessionChannel>>> sessions;
};
}  // namespace tg

#endif  // __TG_SESSION_REGISTRY__
