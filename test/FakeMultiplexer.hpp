#ifndef __TG_FAKE_MULTIPLEXER__
#define __TG_FAKE_MULTIPLEXER__

#include "Multiplexer.hpp"

namespace tg {
/**
 * @brief In-memory multiplexer that records what the gateway asked of it.
 *
 * `attachOrCreate` creates the session right away, the way tmux does once
 * the spawned `new-session` runs.
 */
class FakeMultiplexer : public Multiplexer {
 public:
  FakeMultiplexer()
      : available(true), setOptionFailures(0), spawnProgram("/bin/cat") {}

  bool isAvailable() override { return available; }

  bool exists(const string& name) override {
    return sessions.find(name) != sessions.end();
  }

  bool createDetached(const string& name) override {
    if (exists(name)) {
      return true;
    }
    sessions.insert(name);
    creations.push_back(name);
    return true;
  }

  SpawnCommand attachOrCreate(const string& name) override {
    SpawnCommand command;
    command.program = spawnProgram;
    command.args = spawnArgs;
    command.createsSession = !exists(name);
    if (command.createsSession) {
      sessions.insert(name);
      creations.push_back(name);
    } else {
      attachments.push_back(name);
    }
    return command;
  }

  void kill(const string& name) override {
    sessions.erase(name);
    kills.push_back(name);
  }

  vector<string> list(const string& prefix) override {
    vector<string> result;
    for (const auto& name : sessions) {
      if (startsWith(name, prefix)) {
        result.push_back(name.substr(prefix.size()));
      }
    }
    return result;
  }

  bool setOption(const string& target, const string& option,
                 const string& value) override {
    optionAttempts.push_back(target);
    if (setOptionFailures > 0) {
      setOptionFailures--;
      return false;
    }
    options[target][option] = value;
    return true;
  }

  int creationCount(const string& name) const {
    return int(count(creations.begin(), creations.end(), name));
  }

  bool available;
  /** @brief The next this many setOption calls fail. */
  int setOptionFailures;
  /** @brief What attachOrCreate tells the caller to run. */
  string spawnProgram;
  vector<string> spawnArgs;
  set<string> sessions;
  vector<string> creations;
  vector<string> attachments;
  vector<string> kills;
  vector<string> optionAttempts;
  map<string, map<string, string>> options;
};
}  // namespace tg

#endif  // __TG_FAKE_MULTIPLEXER__
