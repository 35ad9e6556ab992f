#include "ModeEnforcer.hpp"

namespace tg {
ModeEnforcer::ModeEnforcer(asio::io_context& _io,
                           shared_ptr<Multiplexer> _multiplexer,
                           const GatewayConfig& _config)
    : io(_io), multiplexer(_multiplexer), config(_config) {}

string ModeEnforcer::describe(const string& target) {
  return target.empty() ? string("global default") : target;
}

void ModeEnforcer::warmup() {
  if (config.echoMode) {
    VLOG(1) << "Echo mode, skipping default session warmup";
    return;
  }
  if (!multiplexer->isAvailable()) {
    LOG(INFO) << "tmux not available, skipping default session warmup";
    return;
  }
  string defaultName =
      config.multiplexerSessionName(config.defaultSessionId);
  if (!multiplexer->createDetached(defaultName)) {
    LOG(ERROR) << "Could not create default session " << defaultName;
  }

  applyWithRetry("");
  // Global options only reach sessions created after they are set.
  for (const auto& sessionId : multiplexer->list(config.sessionPrefix)) {
    applyWithRetry(config.multiplexerSessionName(sessionId));
  }
}

void ModeEnforcer::scheduleSessionMode(const string& name) {
  auto self = shared_from_this();
  auto timer = make_shared<asio::steady_timer>(io);
  timer->expires_after(config.postSpawnModeDelay);
  timer->async_wait(
      [self, timer, name](const boost::system::error_code& ec) {
        if (ec) {
          return;
        }
        self->applyWithRetry(name);
      });
}

void ModeEnforcer::applyWithRetry(const string& target,
                                  function<void(bool)> onDone) {
  attempt(target, 1, std::move(onDone));
}

void ModeEnforcer::attempt(const string& target, int attemptNumber,
                           function<void(bool)> onDone) {
  if (multiplexer->setOption(target, config.modeOption, config.modeValue)) {
    VLOG(1) << "Enabled " << config.modeOption << " on "
            << describe(target) << " (attempt " << attemptNumber << ")";
    if (onDone) {
      onDone(true);
    }
    return;
  }
  if (attemptNumber >= config.modeAttempts) {
    LOG(ERROR) << "Giving up enabling " << config.modeOption << " on "
               << describe(target) << " after " << attemptNumber
               << " attempts";
    if (onDone) {
      onDone(false);
    }
    return;
  }
  LOG(INFO) << "Enabling " << config.modeOption << " on " << describe(target)
            << " failed, retrying in " << config.modeRetryInterval.count()
            << "ms";
  auto self = shared_from_this();
  auto timer = make_shared<asio::steady_timer>(io);
  timer->expires_after(config.modeRetryInterval);
  timer->async_wait([self, timer, target, attemptNumber,
                     onDone](const boost::system::error_code& ec) {
    if (ec) {
      return;
    }
    self->attempt(target, attemptNumber + 1, onDone);
  });
}
}  // namespace tg
