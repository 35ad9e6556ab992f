#include "SessionChannel.hpp"

namespace tg {
SessionChannel::SessionChannel(asio::io_context& io, const string& _sessionId,
                               weak_ptr<MessageSink> _sink,
                               const SessionServices& _services)
    : sessionId(_sessionId),
      connectionId(sole::uuid4().str()),
      sink(_sink),
      services(_services),
      state(ChannelState::HANDSHAKING),
      heartbeatTimer(io) {}

SessionChannel::~SessionChannel() { killBridge(); }

void SessionChannel::start() {
  if (state != ChannelState::HANDSHAKING) {
    return;
  }
  LOG(INFO) << "Terminal connection " << connectionId << " for session "
            << sessionId;
  bridge = services.bridgeFactory->create(sessionId);
  if (!bridge) {
    LOG(ERROR) << "Failed to create PTY for session " << sessionId;
    ErrorMessage error;
    error.message = "Failed to create PTY";
    send(error);
    teardown(true);
    return;
  }

  weak_ptr<SessionChannel> weakSelf = shared_from_this();
  bridge->onData([weakSelf](const string& data) {
    auto self = weakSelf.lock();
    if (!self || self->state != ChannelState::ACTIVE) {
      return;
    }
    OutputMessage output;
    output.data = data;
    self->send(output);
  });
  state = ChannelState::ACTIVE;
  services.registry->add(sessionId, connectionId, weakSelf);
  bridge->onExit([weakSelf]() {
    auto self = weakSelf.lock();
    if (!self) {
      return;
    }
    LOG(INFO) << "Terminal for session " << self->sessionId << " exited";
    self->teardown(true);
  });
  scheduleHeartbeat();
}

void SessionChannel::handleText(const string& text) {
  if (state != ChannelState::ACTIVE) {
    VLOG(1) << "Ignoring message on inactive connection " << connectionId;
    return;
  }
  optional<ClientMessage> message;
  try {
    message = parseClientMessage(text);
  } catch (const runtime_error& e) {
    LOG(ERROR) << "Error handling message on session " << sessionId << ": "
               << e.what();
    return;
  }
  if (!message) {
    VLOG(1) << "Ignoring message of unknown type on session " << sessionId;
    return;
  }
  services.activityReporter->reportActivity(sessionId);
  handleMessage(*message);
}

void SessionChannel::handleMessage(const ClientMessage& message) {
  // Hold on: the bridge may exit (and release us) while handling input.
  auto self = shared_from_this();
  if (auto input = get_if<InputMessage>(&message)) {
    VLOG(4) << "Writing " << input->data.size() << " bytes to session "
            << sessionId;
    bridge->write(input->data);
  } else if (auto resize = get_if<ResizeMessage>(&message)) {
    if (!resize->isValid()) {
      VLOG(1) << "Ignoring resize without usable dimensions";
      return;
    }
    VLOG(1) << "Resizing session " << sessionId << " to " << *resize->cols
            << "x" << *resize->rows;
    bridge->resize(*resize->cols, *resize->rows);
  } else if (get_if<CloseSessionMessage>(&message)) {
    string name =
        services.context->getConfig().multiplexerSessionName(sessionId);
    LOG(INFO) << "Closing session " << sessionId << " permanently";
    killBridge();
    services.multiplexer->kill(name);
    teardown(true);
  }
}

void SessionChannel::send(const ServerMessage& message) {
  auto messageSink = sink.lock();
  if (!messageSink) {
    return;
  }
  messageSink->sendText(serializeServerMessage(message));
}

void SessionChannel::scheduleHeartbeat() {
  auto interval = services.context->getConfig().heartbeatInterval;
  if (interval.count() <= 0) {
    return;
  }
  weak_ptr<SessionChannel> weakSelf = shared_from_this();
  heartbeatTimer.expires_after(interval);
  heartbeatTimer.async_wait([weakSelf](const boost::system::error_code& ec) {
    auto self = weakSelf.lock();
    if (ec || !self || self->state != ChannelState::ACTIVE) {
      return;
    }
    self->services.activityReporter->reportActivity(self->sessionId);
    self->scheduleHeartbeat();
  });
}

void SessionChannel::killBridge() {
  if (!bridge) {
    return;
  }
  auto oldBridge = bridge;
  bridge.reset();
  oldBridge->onData(Bridge::DataCallback());
  oldBridge->onExit(Bridge::ExitCallback());
  oldBridge->kill();
}

void SessionChannel::teardown(bool closeTransport) {
  if (state == ChannelState::CLOSING || state == ChannelState::CLOSED) {
    return;
  }
  bool wasRegistered = (state == ChannelState::ACTIVE);
  state = closeTransport ? ChannelState::CLOSING : ChannelState::CLOSED;
  heartbeatTimer.cancel();
  killBridge();
  if (wasRegistered) {
    services.registry->remove(sessionId, connectionId);
  }
  if (closeTransport) {
    auto messageSink = sink.lock();
    if (messageSink) {
      messageSink->close();
    }
  }
}

void SessionChannel::handleTransportClosed() {
  if (state == ChannelState::CLOSED) {
    return;
  }
  VLOG(1) << "Transport closed for connection " << connectionId;
  teardown(false);
  state = ChannelState::CLOSED;
}

void SessionChannel::close() { teardown(true); }
}  // namespace tg
