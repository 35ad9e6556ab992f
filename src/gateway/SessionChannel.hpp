#ifndef __TG_SESSION_CHANNEL__
#define __TG_SESSION_CHANNEL__

#include "ActivityReporter.hpp"
#include "Bridge.hpp"
#include "BridgeFactory.hpp"
#include "GatewayContext.hpp"
#include "Headers.hpp"
#include "Multiplexer.hpp"
#include "SessionMessages.hpp"
#include "SessionRegistry.hpp"

namespace tg {
/**
 * @brief The transport side of a connection, as seen by its channel.
 */
class MessageSink {
 public:
  virtual ~MessageSink() {}
  /** @brief Queues one text frame. */
  virtual void sendText(const string& text) = 0;
  /** @brief Closes the transport once queued frames are sent. */
  virtual void close() = 0;
};

/**
 * @brief What every channel shares with the rest of the gateway.
 */
struct SessionServices {
  shared_ptr<GatewayContext> context;
  shared_ptr<BridgeFactory> bridgeFactory;
  shared_ptr<Multiplexer> multiplexer;
  shared_ptr<SessionRegistry> registry;
  shared_ptr<ActivityReporter> activityReporter;
};

enum class ChannelState { HANDSHAKING, ACTIVE, CLOSING, CLOSED };

/**
 * @brief Per-connection state machine between a transport and a Bridge.
 *
 * HANDSHAKING until `start()` has created the Bridge, ACTIVE while messages
 * flow, CLOSING once the gateway asked the transport to close and CLOSED once
 * the transport is gone.  Leaving ACTIVE always kills the Bridge; only a
 * close-session message also kills the tmux session.
 */
class SessionChannel : public enable_shared_from_this<SessionChannel> {
 public:
  SessionChannel(asio::io_context& io, const string& _sessionId,
                 weak_ptr<MessageSink> _sink, const SessionServices& _services);
  virtual ~SessionChannel();

  /**
   * @brief Creates and wires the Bridge.  On failure the client gets one
   * error message and the transport is closed.
   */
  void start();

  /** @brief Handles one inbound text frame. */
  void handleText(const string& text);

  /** @brief The transport closed or failed; same path either way. */
  void handleTransportClosed();

  /** @brief Closes the connection from the gateway side. */
  void close();

  inline ChannelState getState() const { return state; }
  inline const string& getSessionId() const { return sessionId; }
  inline const string& getConnectionId() const { return connectionId; }
  inline shared_ptr<Bridge> getBridge() const { return bridge; }

 protected:
  string sessionId;
  string connectionId;
  weak_ptr<MessageSink> sink;
  SessionServices services;
  ChannelState state;
  shared_ptr<Bridge> bridge;
  asio::steady_timer heartbeatTimer;

  void handleMessage(const ClientMessage& message);
  void send(const ServerMessage& message);
  void scheduleHeartbeat();
  /** @brief Detaches from and kills the Bridge.  Idempotent. */
  void killBridge();
  /** @brief Leaves ACTIVE; optionally asks the transport to close. */
  void teardown(bool closeTransport);
};
}  // namespace tg

#endif  // __TG_SESSION_CHANNEL__
