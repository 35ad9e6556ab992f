#include "BridgeFactory.hpp"

#include "EchoBridge.hpp"
#include "PtyBridge.hpp"

namespace tg {
shared_ptr<Bridge> EchoBridgeFactory::create(const string& sessionId) {
  VLOG(1) << "Creating echo terminal for session " << sessionId;
  shared_ptr<EchoBridge> bridge(
      new EchoBridge(io, config.defaultCols, config.defaultRows));
  bridge->start();
  return bridge;
}

shared_ptr<Bridge> PtyBridgeFactory::create(const string& sessionId) {
  PtySpawnOptions options;
  options.cols = config.defaultCols;
  options.rows = config.defaultRows;
  options.workingDirectory = GetHomeDirectory();
  options.strippedEnvPrefixes = config.strippedEnvPrefixes;

  string name = config.multiplexerSessionName(sessionId);
  bool usingMultiplexer = multiplexer->isAvailable();
  if (usingMultiplexer) {
    SpawnCommand command = multiplexer->attachOrCreate(name);
    if (command.createsSession) {
      LOG(INFO) << "Creating new tmux session: " << name;
    } else {
      LOG(INFO) << "Attaching to existing tmux session: " << name;
    }
    options.program = command.program;
    options.args = command.args;
  } else {
    const char* shell = ::getenv("SHELL");
    options.program = (shell && *shell) ? string(shell) : string("/bin/bash");
    LOG(INFO) << "tmux not available, using regular shell " << options.program;
  }

  auto bridge = PtyBridge::spawn(io, options);
  if (!bridge) {
    return nullptr;
  }
  if (usingMultiplexer) {
    modeEnforcer->scheduleSessionMode(name);
  }
  return bridge;
}
}  // namespace tg
