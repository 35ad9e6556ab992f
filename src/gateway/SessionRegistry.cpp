#include "SessionRegistry.hpp"

#include "SessionChannel.hpp"

namespace tg {
void SessionRegistry::add(const string& sessionId, const string& connectionId,
                          weak_ptr<SessionChannel> channel) {
  sessions[sessionId][connectionId] = channel;
  VLOG(1) << "Registered connection " << connectionId << " for session "
          << sessionId << " (" << sessions[sessionId].size() << " open)";
}

void SessionRegistry::remove(const string& sessionId,
                             const string& connectionId) {
  auto it = sessions.find(sessionId);
  if (it == sessions.end()) {
    return;
  }
  it->second.erase(connectionId);
  if (it->second.empty()) {
    sessions.erase(it);
  }
}

int SessionRegistry::connectionCount(const string& sessionId) const {
  auto it = sessions.find(sessionId);
  if (it == sessions.end()) {
    return 0;
  }
  return int(it->second.size());
}

int SessionRegistry::size() const {
  int total = 0;
  for (const auto& it : sessions) {
    total += int(it.second.size());
  }
  return total;
}

vector<string> SessionRegistry::sessionIds() const {
  vector<string> ids;
  for (const auto& it : sessions) {
    ids.push_back(it.first);
  }
  return ids;
}

void SessionRegistry::closeAll() {
  // Closing a channel removes it from the map, so work from a snapshot.
  vector<shared_ptr<SessionChannel>> channels;
  for (const auto& it : sessions) {
    for (const auto& it2 : it.second) {
      auto channel = it2.second.lock();
      if (channel) {
        channels.push_back(channel);
      }
    }
  }
  LOG(INFO) << "Closing " << channels.size() << " connections";
  for (auto& channel : channels) {
    channel->close();
  }
  sessions.clear();
}
}  // namespace tg
