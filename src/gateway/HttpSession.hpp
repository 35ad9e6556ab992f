#ifndef __TG_HTTP_SESSION__
#define __TG_HTTP_SESSION__

#include "Headers.hpp"
#include "LayoutStore.hpp"
#include "SessionAdmin.hpp"
#include "WebSocketConnection.hpp"

namespace tg {
/**
 * @brief Everything the HTTP side needs to serve requests and hand off
 * upgrades.
 */
struct GatewayComponents {
  SessionServices services;
  shared_ptr<LayoutStore> layoutStore;
  shared_ptr<SessionAdmin> sessionAdmin;
};

typedef http::request<http::string_body> HttpRequest;
typedef http::response<http::string_body> HttpResponse;

/**
 * @brief Reads HTTP requests from one accepted socket.
 *
 * A WebSocket upgrade for the terminal endpoint turns the socket into a
 * WebSocketConnection; an upgrade for any other path is dropped without a
 * response.  Everything else goes to `route()`.
 */
class HttpSession : public enable_shared_from_this<HttpSession> {
 public:
  HttpSession(tcp::socket&& socket, asio::io_context& _io,
              const GatewayComponents& _components);

  void run();

  /**
   * @brief Answers a plain (non-upgrade) HTTP request: health, layout and
   * session administration, CORS preflight, or 404.
   */
  static HttpResponse route(const GatewayComponents& components,
                            const HttpRequest& request);

 protected:
  asio::io_context& io;
  beast::tcp_stream stream;
  beast::flat_buffer buffer;
  GatewayComponents components;
  HttpRequest request;

  void doRead();
  void onRead(const beast::error_code& ec, std::size_t bytesTransferred);
  void handleUpgrade();
  void onWrite(bool keepAlive, const beast::error_code& ec);
  void doClose();
};
}  // namespace tg

#endif  // __TG_HTTP_SESSION__
