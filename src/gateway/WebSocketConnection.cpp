#include "WebSocketConnection.hpp"

namespace tg {
WebSocketConnection::WebSocketConnection(tcp::socket&& socket,
                                         asio::io_context& _io,
                                         const string& _sessionId,
                                         const SessionServices& _services)
    : io(_io),
      ws(std::move(socket)),
      sessionId(_sessionId),
      services(_services),
      closeRequested(false),
      closeStarted(false),
      transportClosed(false) {}

void WebSocketConnection::run(http::request<http::string_body> request) {
  // Handshake timeout only: idle terminals stay connected indefinitely.
  ws.set_option(
      websocket::stream_base::timeout::suggested(beast::role_type::server));
  ws.set_option(
      websocket::stream_base::decorator([](websocket::response_type& res) {
        res.set(http::field::server, string("tgserver/") + TG_VERSION);
      }));
  auto self = shared_from_this();
  ws.async_accept(request,
                  [self](const beast::error_code& ec) { self->onAccept(ec); });
}

void WebSocketConnection::onAccept(const beast::error_code& ec) {
  if (ec) {
    LOG(INFO) << "WebSocket handshake failed: " << ec.message();
    transportClosed = true;
    return;
  }
  channel.reset(
      new SessionChannel(io, sessionId, weak_from_this(), services));
  channel->start();
  doRead();
}

void WebSocketConnection::doRead() {
  if (transportClosed) {
    return;
  }
  auto self = shared_from_this();
  ws.async_read(readBuffer, [self](const beast::error_code& ec,
                                   std::size_t bytesTransferred) {
    self->onRead(ec, bytesTransferred);
  });
}

void WebSocketConnection::onRead(const beast::error_code& ec,
                                 std::size_t bytesTransferred) {
  if (ec) {
    handleClosed(ec);
    return;
  }
  VLOG(4) << "Read frame of " << bytesTransferred << " bytes";
  // Binary frames are treated as text.
  string text = beast::buffers_to_string(readBuffer.data());
  readBuffer.consume(readBuffer.size());
  channel->handleText(text);
  doRead();
}

void WebSocketConnection::sendText(const string& text) {
  if (transportClosed || closeRequested) {
    VLOG(1) << "Dropping message on closing connection";
    return;
  }
  writeQueue.push_back(text);
  if (writeQueue.size() == 1) {
    doWrite();
  }
}

void WebSocketConnection::doWrite() {
  auto self = shared_from_this();
  ws.text(true);
  ws.async_write(asio::buffer(writeQueue.front()),
                 [self](const beast::error_code& ec,
                        std::size_t bytesTransferred) {
                   self->onWrite(ec, bytesTransferred);
                 });
}

void WebSocketConnection::onWrite(const beast::error_code& ec,
                                  std::size_t bytesTransferred) {
  if (ec) {
    writeQueue.clear();
    handleClosed(ec);
    return;
  }
  VLOG(4) << "Wrote frame of " << bytesTransferred << " bytes";
  writeQueue.pop_front();
  if (!writeQueue.empty()) {
    doWrite();
  } else if (closeRequested) {
    doClose();
  }
}

void WebSocketConnection::close() {
  if (closeRequested || transportClosed) {
    return;
  }
  closeRequested = true;
  if (writeQueue.empty()) {
    doClose();
  }
}

void WebSocketConnection::doClose() {
  if (closeStarted || transportClosed) {
    return;
  }
  closeStarted = true;
  auto self = shared_from_this();
  ws.async_close(websocket::close_code::normal,
                 [self](const beast::error_code& ec) {
                   if (ec) {
                     VLOG(1) << "WebSocket close: " << ec.message();
                   }
                   self->handleClosed(ec);
                 });
}

void WebSocketConnection::handleClosed(const beast::error_code& ec) {
  if (transportClosed) {
    return;
  }
  transportClosed = true;
  if (ec && ec != websocket::error::closed &&
      ec != asio::error::operation_aborted) {
    LOG(INFO) << "Terminal connection error: " << ec.message();
  }
  if (channel) {
    channel->handleTransportClosed();
  }
  if (!closeStarted) {
    beast::error_code ignored;
    beast::get_lowest_layer(ws).socket().shutdown(tcp::socket::shutdown_both,
                                                  ignored);
    beast::get_lowest_layer(ws).socket().close(ignored);
  }
}
}  // namespace tg
