#include "ModeEnforcer.hpp"

#include "FakeMultiplexer.hpp"
#include "TestHeaders.hpp"

using namespace tg;

namespace {
GatewayConfig fastConfig() {
  GatewayConfig config;
  config.modeRetryInterval = chrono::milliseconds(10);
  config.postSpawnModeDelay = chrono::milliseconds(10);
  return config;
}
}  // namespace

TEST_CASE("Mode enforcement survives two failed attempts", "[ModeEnforcer]") {
  asio::io_context io;
  shared_ptr<FakeMultiplexer> multiplexer(new FakeMultiplexer());
  multiplexer->setOptionFailures = 2;
  shared_ptr<ModeEnforcer> enforcer(
      new ModeEnforcer(io, multiplexer, fastConfig()));

  optional<bool> outcome;
  enforcer->applyWithRetry("sandbox-a", [&outcome](bool ok) { outcome = ok; });
  REQUIRE(!outcome);
  REQUIRE(runUntil(io, [&outcome]() { return bool(outcome); }));
  REQUIRE(*outcome);
  REQUIRE(multiplexer->optionAttempts.size() == 3);
  REQUIRE(multiplexer->options["sandbox-a"]["mouse"] == "on");
}

TEST_CASE("Mode enforcement gives up after the configured attempts",
          "[ModeEnforcer]") {
  asio::io_context io;
  shared_ptr<FakeMultiplexer> multiplexer(new FakeMultiplexer());
  multiplexer->setOptionFailures = 10;
  shared_ptr<ModeEnforcer> enforcer(
      new ModeEnforcer(io, multiplexer, fastConfig()));

  optional<bool> outcome;
  enforcer->applyWithRetry("", [&outcome](bool ok) { outcome = ok; });
  REQUIRE(runUntil(io, [&outcome]() { return bool(outcome); }));
  REQUIRE(!*outcome);
  REQUIRE(multiplexer->optionAttempts.size() == 3);
  REQUIRE(multiplexer->options.empty());
}

TEST_CASE("Warmup creates the default session and enables the mode",
          "[ModeEnforcer]") {
  asio::io_context io;
  shared_ptr<FakeMultiplexer> multiplexer(new FakeMultiplexer());
  multiplexer->sessions.insert("sandbox-p1");
  multiplexer->sessions.insert("unrelated");
  multiplexer->setOptionFailures = 1;
  shared_ptr<ModeEnforcer> enforcer(
      new ModeEnforcer(io, multiplexer, fastConfig()));

  enforcer->warmup();
  REQUIRE(multiplexer->creations == vector<string>({"sandbox-default"}));
  REQUIRE(runUntil(io, [multiplexer]() {
    return multiplexer->options.size() == 3;
  }));
  REQUIRE(multiplexer->options[""]["mouse"] == "on");
  REQUIRE(multiplexer->options["sandbox-default"]["mouse"] == "on");
  REQUIRE(multiplexer->options["sandbox-p1"]["mouse"] == "on");
  REQUIRE(multiplexer->options.count("unrelated") == 0);

  // A second warmup does not create anything new.
  enforcer->warmup();
  REQUIRE(multiplexer->creations.size() == 1);
}

TEST_CASE("Warmup is skipped without tmux or in echo mode",
          "[ModeEnforcer]") {
  asio::io_context io;
  shared_ptr<FakeMultiplexer> multiplexer(new FakeMultiplexer());

  SECTION("tmux unavailable") {
    multiplexer->available = false;
    shared_ptr<ModeEnforcer> enforcer(
        new ModeEnforcer(io, multiplexer, fastConfig()));
    enforcer->warmup();
  }

  SECTION("echo mode") {
    GatewayConfig config = fastConfig();
    config.echoMode = true;
    shared_ptr<ModeEnforcer> enforcer(
        new ModeEnforcer(io, multiplexer, config));
    enforcer->warmup();
  }

  REQUIRE(multiplexer->creations.empty());
  REQUIRE(multiplexer->optionAttempts.empty());
}

TEST_CASE("Post-spawn mode enforcement waits for the delay",
          "[ModeEnforcer]") {
  asio::io_context io;
  shared_ptr<FakeMultiplexer> multiplexer(new FakeMultiplexer());
  shared_ptr<ModeEnforcer> enforcer(
      new ModeEnforcer(io, multiplexer, fastConfig()));

  enforcer->scheduleSessionMode("sandbox-new");
  REQUIRE(multiplexer->optionAttempts.empty());
  REQUIRE(runUntil(io, [multiplexer]() {
    return multiplexer->options.count("sandbox-new") == 1;
  }));
}
