#include "SessionAdmin.hpp"

namespace tg {
vector<string> SessionAdmin::listSessions() {
  return multiplexer->list(config.sessionPrefix);
}

int SessionAdmin::restartAll() {
  auto sessions = listSessions();
  for (const auto& sessionId : sessions) {
    multiplexer->kill(config.multiplexerSessionName(sessionId));
  }
  LOG(INFO) << "Killed " << sessions.size() << " tmux session(s)";
  modeEnforcer->warmup();
  return int(sessions.size());
}
}  // namespace tg
