#include <future>
#include <thread>

#include "EchoBridge.hpp"
#include "FakeMultiplexer.hpp"
#include "GatewayServer.hpp"
#include "JsonLib.hpp"
#include "TestHeaders.hpp"

namespace tg {
namespace {
/**
 * @brief Echo terminals that still go through the multiplexer's
 * attach-or-create decision, so session lifetimes can be observed.
 */
class MultiplexedEchoBridgeFactory : public BridgeFactory {
 public:
  MultiplexedEchoBridgeFactory(asio::io_context& _io,
                               shared_ptr<Multiplexer> _multiplexer,
                               const GatewayConfig& _config)
      : io(_io), multiplexer(_multiplexer), config(_config) {}

  shared_ptr<Bridge> create(const string& sessionId) override {
    multiplexer->attachOrCreate(config.multiplexerSessionName(sessionId));
    shared_ptr<EchoBridge> bridge(
        new EchoBridge(io, config.defaultCols, config.defaultRows));
    bridge->start(chrono::milliseconds(1));
    return bridge;
  }

  asio::io_context& io;
  shared_ptr<Multiplexer> multiplexer;
  GatewayConfig config;
};

class TestClient {
 public:
  explicit TestClient(int _port) : port(_port), ws(clientIo) {}

  ~TestClient() {
    beast::error_code ec;
    ws.next_layer().close(ec);
  }

  /** @brief Returns the HTTP status of the handshake response. */
  http::status connect(const string& target) {
    tcp::endpoint endpoint(asio::ip::make_address("127.0.0.1"),
                           (unsigned short)port);
    ws.next_layer().connect(endpoint);
    websocket::response_type res;
    beast::error_code ec;
    ws.handshake(res, "127.0.0.1:" + to_string(port), target, ec);
    return res.result();
  }

  void send(const json& message) {
    ws.text(true);
    ws.write(asio::buffer(dumpJson(message)));
  }

  /** @brief Reads one frame; nullopt on close, error or timeout. */
  optional<json> readMessage(
      chrono::milliseconds timeout = chrono::seconds(5)) {
    beast::flat_buffer buffer;
    bool done = false;
    beast::error_code result;
    ws.async_read(buffer, [&done, &result](const beast::error_code& ec,
                                           std::size_t) {
      done = true;
      result = ec;
    });
    clientIo.restart();
    clientIo.run_for(timeout);
    if (!done) {
      beast::error_code ec;
      ws.next_layer().close(ec);
      clientIo.restart();
      clientIo.run();
      return nullopt;
    }
    if (result) {
      lastError = result;
      return nullopt;
    }
    return json::parse(beast::buffers_to_string(buffer.data()));
  }

  /** @brief Accumulates output until it contains `needle`. */
  bool waitForOutput(const string& needle) {
    while (output.find(needle) == string::npos) {
      auto message = readMessage();
      if (!message) {
        return false;
      }
      if ((*message)["type"] == "output") {
        output += (*message)["data"].get<string>();
      }
    }
    return true;
  }

  /** @brief Drains frames until the server closes the connection. */
  bool waitForClose() {
    while (true) {
      auto message = readMessage();
      if (!message) {
        return lastError == websocket::error::closed;
      }
      if ((*message)["type"] == "error") {
        return false;
      }
    }
  }

  int port;
  asio::io_context clientIo;
  websocket::stream<tcp::socket> ws;
  string output;
  beast::error_code lastError;
};

HttpResponse httpRequest(int port, http::verb method, const string& target,
                         const string& body = "",
                         const string& origin = "") {
  asio::io_context clientIo;
  tcp::socket socket(clientIo);
  socket.connect(tcp::endpoint(asio::ip::make_address("127.0.0.1"),
                               (unsigned short)port));
  HttpRequest req(method, target, 11);
  req.set(http::field::host, "127.0.0.1");
  req.keep_alive(false);
  if (!origin.empty()) {
    req.set(http::field::origin, origin);
  }
  if (!body.empty()) {
    req.set(http::field::content_type, "application/json");
    req.body() = body;
  }
  req.prepare_payload();
  http::write(socket, req);

  beast::flat_buffer buffer;
  HttpResponse res;
  http::read(socket, buffer, res);
  beast::error_code ec;
  socket.shutdown(tcp::socket::shutdown_both, ec);
  return res;
}

struct ServerFixture {
  ServerFixture() : multiplexer(new FakeMultiplexer()) {
    string pattern = GetTempDirectory() + string("tg_server_XXXXXXXX");
    layoutDirectory = string(mkdtemp(&pattern[0]));

    GatewayConfig config;
    config.port = 0;
    config.bindIp = "127.0.0.1";
    config.echoMode = true;
    config.layoutDirectory = layoutDirectory;
    config.allowedOrigins = {"https://moltshell.sh"};
    shared_ptr<GatewayContext> context(new GatewayContext(config));
    shared_ptr<BridgeFactory> factory(
        new MultiplexedEchoBridgeFactory(io, multiplexer, config));
    server.reset(new GatewayServer(io, context, multiplexer, factory));
    server->start();
    port = server->getPort();
    ioThread = thread([this]() {
      auto work = asio::make_work_guard(io);
      io.run();
    });
  }

  ~ServerFixture() {
    io.stop();
    ioThread.join();
    server.reset();
    std::error_code ec;
    fs::remove_all(layoutDirectory, ec);
  }

  /** @brief Runs `fn` on the server's thread and waits for its result. */
  template <typename T>
  T onServer(function<T()> fn) {
    auto task = make_shared<packaged_task<T()>>(fn);
    auto result = task->get_future();
    asio::post(io, [task]() { (*task)(); });
    return result.get();
  }

  asio::io_context io;
  shared_ptr<FakeMultiplexer> multiplexer;
  shared_ptr<GatewayServer> server;
  string layoutDirectory;
  int port;
  thread ioThread;
};
}  // namespace

TEST_CASE("Echo over the terminal endpoint", "[GatewayServer]") {
  ServerFixture f;
  TestClient client(f.port);
  REQUIRE(client.connect("/ws/terminal?session=alpha") ==
          http::status::switching_protocols);
  REQUIRE(client.waitForOutput(EchoBridge::PROMPT));

  json input;
  input["type"] = "input";
  input["data"] = "echo hi\n";
  client.send(input);
  REQUIRE(client.waitForOutput("\r\nhi\r\n"));

  auto creations = f.onServer<int>(
      [&f]() { return f.multiplexer->creationCount("sandbox-alpha"); });
  REQUIRE(creations == 1);
}

TEST_CASE("close-session forces a fresh session on reconnect",
          "[GatewayServer]") {
  ServerFixture f;
  {
    TestClient client(f.port);
    REQUIRE(client.connect("/ws/terminal?session=beta") ==
            http::status::switching_protocols);
    REQUIRE(client.waitForOutput(EchoBridge::PROMPT));
    json input;
    input["type"] = "input";
    input["data"] = "echo remembered\r";
    client.send(input);
    REQUIRE(client.waitForOutput("\r\nremembered\r\n"));

    json close;
    close["type"] = "close-session";
    client.send(close);
    REQUIRE(client.waitForClose());
  }
  REQUIRE(f.onServer<bool>(
              [&f]() { return f.multiplexer->exists("sandbox-beta"); }) ==
          false);

  TestClient client(f.port);
  REQUIRE(client.connect("/ws/terminal?session=beta") ==
          http::status::switching_protocols);
  REQUIRE(client.waitForOutput(EchoBridge::PROMPT));
  REQUIRE(client.output.find("remembered") == string::npos);
  REQUIRE(f.onServer<int>([&f]() {
    return f.multiplexer->creationCount("sandbox-beta");
  }) == 2);
}

TEST_CASE("Reconnecting without close-session reattaches",
          "[GatewayServer]") {
  ServerFixture f;
  {
    TestClient client(f.port);
    REQUIRE(client.connect("/ws/terminal") ==
            http::status::switching_protocols);
    REQUIRE(client.waitForOutput(EchoBridge::PROMPT));
  }
  TestClient client(f.port);
  REQUIRE(client.connect("/ws/terminal?session=default") ==
          http::status::switching_protocols);
  REQUIRE(client.waitForOutput(EchoBridge::PROMPT));
  REQUIRE(f.onServer<int>([&f]() {
    return f.multiplexer->creationCount("sandbox-default");
  }) == 1);
}

TEST_CASE("Resize is reflected by tput cols", "[GatewayServer]") {
  ServerFixture f;
  TestClient client(f.port);
  REQUIRE(client.connect("/ws/terminal?session=gamma") ==
          http::status::switching_protocols);
  REQUIRE(client.waitForOutput(EchoBridge::PROMPT));

  json resize;
  resize["type"] = "resize";
  resize["cols"] = 120;
  resize["rows"] = 40;
  client.send(resize);
  // Malformed frames in between are dropped.
  client.ws.text(true);
  client.ws.write(asio::buffer(string("{garbage")));
  json input;
  input["type"] = "input";
  input["data"] = "tput cols\r";
  client.send(input);
  REQUIRE(client.waitForOutput("\r\n120\r\n"));
}

TEST_CASE("Upgrades for other paths or bad session ids are refused",
          "[GatewayServer]") {
  ServerFixture f;
  {
    TestClient client(f.port);
    REQUIRE(client.connect("/ws/other?session=alpha") !=
            http::status::switching_protocols);
  }
  {
    TestClient client(f.port);
    REQUIRE(client.connect("/ws/terminal?session=a%3Ab") ==
            http::status::bad_request);
  }
  REQUIRE(f.onServer<int>([&f]() { return int(f.multiplexer->creations.size()); }) == 0);
}

TEST_CASE("HTTP routes", "[GatewayServer]") {
  ServerFixture f;

  auto health = httpRequest(f.port, http::verb::get, "/health");
  REQUIRE(health.result() == http::status::ok);
  auto healthBody = json::parse(health.body());
  REQUIRE(healthBody["status"] == "ok");
  REQUIRE(healthBody["mode"] == "echo");
  REQUIRE(healthBody["sandboxId"] == "not-configured");
  REQUIRE(healthBody["connections"] == 0);
  REQUIRE(healthBody["attached"] == json::object());

  auto missing = httpRequest(f.port, http::verb::get, "/api/layout");
  REQUIRE(missing.result() == http::status::not_found);
  REQUIRE(json::parse(missing.body())["error"] == "No saved layout");

  auto saved = httpRequest(f.port, http::verb::post, "/api/layout",
                           R"({"panes":["default","p2"]})");
  REQUIRE(saved.result() == http::status::ok);
  REQUIRE(json::parse(saved.body())["ok"] == true);

  auto loaded = httpRequest(f.port, http::verb::get, "/api/layout");
  REQUIRE(loaded.result() == http::status::ok);
  REQUIRE(json::parse(loaded.body())["panes"][1] == "p2");

  auto invalid =
      httpRequest(f.port, http::verb::post, "/api/layout", "{nope");
  REQUIRE(invalid.result() == http::status::bad_request);

  auto notFound = httpRequest(f.port, http::verb::get, "/nope");
  REQUIRE(notFound.result() == http::status::not_found);
  REQUIRE(json::parse(notFound.body())["error"] == "Not found");

  auto preflight = httpRequest(f.port, http::verb::options, "/api/layout", "",
                               "https://moltshell.sh");
  REQUIRE(preflight.result() == http::status::no_content);
  REQUIRE(preflight[http::field::access_control_allow_origin] ==
          "https://moltshell.sh");

  auto foreign = httpRequest(f.port, http::verb::get, "/api/sessions", "",
                             "https://evil.example");
  REQUIRE(foreign.find(http::field::access_control_allow_origin) ==
          foreign.end());
}

TEST_CASE("Session listing and restart", "[GatewayServer]") {
  ServerFixture f;
  TestClient client(f.port);
  REQUIRE(client.connect("/ws/terminal?session=p1") ==
          http::status::switching_protocols);
  REQUIRE(client.waitForOutput(EchoBridge::PROMPT));

  auto health = httpRequest(f.port, http::verb::get, "/health");
  auto healthBody = json::parse(health.body());
  REQUIRE(healthBody["connections"] == 1);
  REQUIRE(healthBody["attached"] == json::parse(R"({"p1":1})"));

  auto sessions = httpRequest(f.port, http::verb::get, "/api/sessions");
  REQUIRE(json::parse(sessions.body())["sessions"] ==
          json::parse(R"(["p1"])"));

  auto restart =
      httpRequest(f.port, http::verb::post, "/api/sessions/restart");
  REQUIRE(restart.result() == http::status::ok);
  REQUIRE(json::parse(restart.body())["success"] == true);

  sessions = httpRequest(f.port, http::verb::get, "/api/sessions");
  REQUIRE(json::parse(sessions.body())["sessions"].empty());
}
}  // namespace tg
