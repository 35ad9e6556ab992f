#include "TmuxMultiplexer.hpp"

namespace tg {
TmuxMultiplexer::TmuxMultiplexer(shared_ptr<SubprocessUtils> _subprocessUtils,
                                 const string& _tmuxBinary,
                                 const string& _socketName)
    : subprocessUtils(_subprocessUtils),
      tmuxBinary(_tmuxBinary),
      socketName(_socketName) {}

vector<string> TmuxMultiplexer::withSocket(const vector<string>& args) const {
  vector<string> fullArgs;
  if (!socketName.empty()) {
    fullArgs.push_back("-L");
    fullArgs.push_back(socketName);
  }
  fullArgs.insert(fullArgs.end(), args.begin(), args.end());
  return fullArgs;
}

SubprocessResult TmuxMultiplexer::runTmux(const vector<string>& args) {
  return subprocessUtils->run(tmuxBinary, withSocket(args));
}

bool TmuxMultiplexer::isAvailable() {
  return bool(subprocessUtils->findExecutable(tmuxBinary));
}

bool TmuxMultiplexer::exists(const string& name) {
  return runTmux({"has-session", "-t", "=" + name}).succeeded();
}

bool TmuxMultiplexer::createDetached(const string& name) {
  if (exists(name)) {
    return true;
  }
  auto result = runTmux({"new-session", "-d", "-s", name});
  if (!result.succeeded()) {
    // Another client may have won the race; that still counts.
    if (exists(name)) {
      return true;
    }
    LOG(ERROR) << "Failed to create tmux session " << name << " (exit "
               << result.exitCode << ")";
    return false;
  }
  LOG(INFO) << "Created detached tmux session: " << name;
  return true;
}

SpawnCommand TmuxMultiplexer::attachOrCreate(const string& name) {
  SpawnCommand command;
  command.program = tmuxBinary;
  if (exists(name)) {
    command.args = withSocket({"attach-session", "-t", "=" + name});
    command.createsSession = false;
  } else {
    // -A attaches instead if another spawn registers the session first.
    command.args = withSocket({"new-session", "-A", "-s", name});
    command.createsSession = true;
  }
  return command;
}

void TmuxMultiplexer::kill(const string& name) {
  if (runTmux({"kill-session", "-t", "=" + name}).succeeded()) {
    LOG(INFO) << "Killed tmux session: " << name;
  } else {
    VLOG(1) << "No tmux session to kill: " << name;
  }
}

vector<string> TmuxMultiplexer::list(const string& prefix) {
  vector<string> sessions;
  auto result = runTmux({"list-sessions", "-F", "#{session_name}"});
  if (!result.succeeded()) {
    // tmux not running or no sessions
    return sessions;
  }
  for (const auto& line : split(result.output, '\n')) {
    string name = trim(line);
    if (!name.empty() && startsWith(name, prefix)) {
      sessions.push_back(name.substr(prefix.size()));
    }
  }
  return sessions;
}

bool TmuxMultiplexer::setOption(const string& target, const string& option,
                                const string& value) {
  vector<string> args = {"set-option"};
  if (target.empty()) {
    args.push_back("-g");
  } else {
    // set-option takes a target pane; the trailing colon makes the exact
    // session name resolve as one.
    args.push_back("-t");
    args.push_back("=" + target + ":");
  }
  args.push_back(option);
  args.push_back(value);
  auto result = runTmux(args);
  if (!result.succeeded()) {
    VLOG(1) << "tmux set-option " << option << " " << value << " on "
            << (target.empty() ? string("<global>") : target)
            << " failed (exit " << result.exitCode << ")";
    return false;
  }
  return true;
}
}  // namespace tg
