#ifndef __TG_WEBSOCKET_CONNECTION__
#define __TG_WEBSOCKET_CONNECTION__

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "Headers.hpp"
#include "SessionChannel.hpp"

namespace tg {
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
using tcp = asio::ip::tcp;

/**
 * @brief One accepted WebSocket terminal connection.
 *
 * Completes the upgrade, feeds every frame to its SessionChannel and sends
 * the channel's messages one write at a time, in order.
 */
class WebSocketConnection : public MessageSink,
                            public enable_shared_from_this<WebSocketConnection> {
 public:
  WebSocketConnection(tcp::socket&& socket, asio::io_context& _io,
                      const string& _sessionId,
                      const SessionServices& _services);

  /** @brief Accepts the upgrade carried by `request` and starts reading. */
  void run(http::request<http::string_body> request);

  void sendText(const string& text) override;
  void close() override;

  inline shared_ptr<SessionChannel> getChannel() const { return channel; }

 protected:
  asio::io_context& io;
  websocket::stream<beast::tcp_stream> ws;
  string sessionId;
  SessionServices services;
  shared_ptr<SessionChannel> channel;
  beast::flat_buffer readBuffer;
  deque<string> writeQueue;
  bool closeRequested;
  bool closeStarted;
  bool transportClosed;

  void onAccept(const beast::error_code& ec);
  void doRead();
  void onRead(const beast::error_code& ec, std::size_t bytesTransferred);
  void doWrite();
  void onWrite(const beast::error_code& ec, std::size_t bytesTransferred);
  void doClose();
  void handleClosed(const beast::error_code& ec);
};
}  // namespace tg

#endif  // __TG_WEBSOCKET_CONNECTION__
