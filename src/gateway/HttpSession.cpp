#include "HttpSession.hpp"

#include "UrlUtils.hpp"

namespace tg {
namespace {
const chrono::seconds HTTP_READ_TIMEOUT(30);

HttpResponse jsonResponse(const HttpRequest& request, http::status status,
                          const json& body) {
  HttpResponse res(status, request.version());
  res.set(http::field::server, string("tgserver/") + TG_VERSION);
  res.set(http::field::content_type, "application/json; charset=utf-8");
  res.keep_alive(request.keep_alive());
  res.body() = dumpJson(body);
  res.prepare_payload();
  return res;
}

HttpResponse errorResponse(const HttpRequest& request, http::status status,
                           const string& message) {
  json body;
  body["error"] = message;
  return jsonResponse(request, status, body);
}

void addCorsHeaders(const GatewayConfig& config, const HttpRequest& request,
                    HttpResponse* res) {
  auto originIt = request.find(http::field::origin);
  if (originIt != request.end()) {
    string origin(originIt->value());
    const auto& allowed = config.allowedOrigins;
    if (find(allowed.begin(), allowed.end(), origin) != allowed.end()) {
      res->set(http::field::access_control_allow_origin, origin);
      res->set(http::field::vary, "Origin");
    }
  }
  res->set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
  res->set(http::field::access_control_allow_headers, "Content-Type");
}
}  // namespace

HttpSession::HttpSession(tcp::socket&& socket, asio::io_context& _io,
                         const GatewayComponents& _components)
    : io(_io), stream(std::move(socket)), components(_components) {}

void HttpSession::run() { doRead(); }

void HttpSession::doRead() {
  request = {};
  stream.expires_after(HTTP_READ_TIMEOUT);
  auto self = shared_from_this();
  http::async_read(stream, buffer, request,
                   [self](const beast::error_code& ec,
                          std::size_t bytesTransferred) {
                     self->onRead(ec, bytesTransferred);
                   });
}

void HttpSession::onRead(const beast::error_code& ec,
                         std::size_t bytesTransferred) {
  if (ec == http::error::end_of_stream) {
    doClose();
    return;
  }
  if (ec) {
    VLOG(1) << "HTTP read failed: " << ec.message();
    doClose();
    return;
  }
  VLOG(3) << "HTTP " << request.method_string() << " " << request.target()
          << " (" << bytesTransferred << " bytes)";

  if (websocket::is_upgrade(request)) {
    handleUpgrade();
    return;
  }

  auto res = make_shared<HttpResponse>(route(components, request));
  bool keepAlive = res->keep_alive();
  auto self = shared_from_this();
  http::async_write(stream, *res,
                    [self, res, keepAlive](const beast::error_code& writeEc,
                                           std::size_t) {
                      self->onWrite(keepAlive, writeEc);
                    });
}

void HttpSession::handleUpgrade() {
  const auto& config = components.services.context->getConfig();
  ParsedTarget target = parseTarget(string(request.target()));
  if (target.path != config.endpointPath) {
    LOG(INFO) << "Dropping upgrade for unknown path " << target.path;
    doClose();
    return;
  }

  string sessionId = config.defaultSessionId;
  auto it = target.query.find("session");
  if (it != target.query.end() && !it->second.empty()) {
    sessionId = it->second;
  }
  if (!isValidSessionId(sessionId)) {
    LOG(INFO) << "Rejecting upgrade with invalid session id";
    auto res = make_shared<HttpResponse>(
        errorResponse(request, http::status::bad_request,
                      "Invalid session id"));
    res->keep_alive(false);
    auto self = shared_from_this();
    http::async_write(
        stream, *res,
        [self, res](const beast::error_code& writeEc, std::size_t) {
          self->onWrite(false, writeEc);
        });
    return;
  }

  stream.expires_never();
  auto connection = make_shared<WebSocketConnection>(
      stream.release_socket(), io, sessionId, components.services);
  connection->run(std::move(request));
}

void HttpSession::onWrite(bool keepAlive, const beast::error_code& ec) {
  if (ec) {
    VLOG(1) << "HTTP write failed: " << ec.message();
    doClose();
    return;
  }
  if (!keepAlive) {
    doClose();
    return;
  }
  doRead();
}

void HttpSession::doClose() {
  beast::error_code ec;
  stream.socket().shutdown(tcp::socket::shutdown_send, ec);
  if (ec && ec != asio::error::not_connected) {
    VLOG(1) << "HTTP shutdown: " << ec.message();
  }
  stream.socket().close(ec);
}

HttpResponse HttpSession::route(const GatewayComponents& components,
                                const HttpRequest& request) {
  const auto& config = components.services.context->getConfig();
  string path = parseTarget(string(request.target())).path;
  bool isApi = startsWith(path, "/api/");
  auto method = request.method();

  HttpResponse res;
  if (isApi && method == http::verb::options) {
    res = HttpResponse(http::status::no_content, request.version());
    res.keep_alive(request.keep_alive());
    res.prepare_payload();
  } else if (path == "/health" && method == http::verb::get) {
    json body;
    body["status"] = "ok";
    body["mode"] = config.echoMode ? "echo" : "pty";
    body["sandboxId"] =
        config.sandboxId.empty() ? string("not-configured") : config.sandboxId;
    auto registry = components.services.registry;
    body["connections"] = registry->size();
    json attached = json::object();
    for (const auto& sessionId : registry->sessionIds()) {
      attached[sessionId] = registry->connectionCount(sessionId);
    }
    body["attached"] = attached;
    res = jsonResponse(request, http::status::ok, body);
  } else if (path == "/api/layout" && method == http::verb::get) {
    try {
      auto layout = components.layoutStore->get();
      if (!layout) {
        res = errorResponse(request, http::status::not_found,
                            "No saved layout");
      } else {
        res = jsonResponse(request, http::status::ok, *layout);
      }
    } catch (const runtime_error& e) {
      LOG(ERROR) << "Failed to read layout: " << e.what();
      res = errorResponse(request, http::status::internal_server_error,
                          "Failed to read layout");
    }
  } else if (path == "/api/layout" && method == http::verb::post) {
    json layout;
    bool parsed = true;
    try {
      layout = json::parse(request.body());
    } catch (const json::parse_error& e) {
      VLOG(1) << "Rejecting layout: " << e.what();
      parsed = false;
    }
    if (!parsed) {
      res = errorResponse(request, http::status::bad_request, "Invalid JSON");
    } else {
      try {
        components.layoutStore->set(layout);
        json body;
        body["ok"] = true;
        res = jsonResponse(request, http::status::ok, body);
      } catch (const runtime_error& e) {
        LOG(ERROR) << "Failed to save layout: " << e.what();
        res = errorResponse(request, http::status::internal_server_error,
                            "Failed to save layout");
      }
    }
  } else if (path == "/api/sessions" && method == http::verb::get) {
    json body;
    body["sessions"] = components.sessionAdmin->listSessions();
    res = jsonResponse(request, http::status::ok, body);
  } else if (path == "/api/sessions/restart" && method == http::verb::post) {
    try {
      int killed = components.sessionAdmin->restartAll();
      LOG(INFO) << "Restarted sessions, " << killed << " killed";
      json body;
      body["success"] = true;
      res = jsonResponse(request, http::status::ok, body);
    } catch (const std::exception& e) {
      LOG(ERROR) << "Failed to restart sessions: " << e.what();
      res = errorResponse(request, http::status::internal_server_error,
                          "Failed to restart sessions");
    }
  } else {
    res = errorResponse(request, http::status::not_found, "Not found");
  }

  if (isApi) {
    addCorsHeaders(config, request, &res);
  }
  return res;
}
}  // namespace tg
