#include "ActivityReporter.hpp"

#include "TestHeaders.hpp"

using namespace tg;

TEST_CASE("Activity reports are throttled", "[ActivityReporter]") {
  GatewayConfig config;
  config.sandboxId = "sb-1";
  config.heartbeatInterval = chrono::seconds(60);
  shared_ptr<GatewayContext> context(new GatewayContext(config));

  auto start = chrono::steady_clock::now();
  REQUIRE(context->claimActivitySlot(start));
  REQUIRE(!context->claimActivitySlot(start + chrono::seconds(59)));
  REQUIRE(context->claimActivitySlot(start + chrono::seconds(60)));

  LoggingActivityReporter reporter(
      shared_ptr<GatewayContext>(new GatewayContext(config)));
  reporter.reportActivity("a");
  reporter.reportActivity("b");
  REQUIRE(reporter.getReportCount() == 1);
}

TEST_CASE("Activity reporter is inert without a sandbox id",
          "[ActivityReporter]") {
  GatewayConfig config;
  LoggingActivityReporter reporter(
      shared_ptr<GatewayContext>(new GatewayContext(config)));
  reporter.reportActivity("a");
  REQUIRE(reporter.getReportCount() == 0);
}
