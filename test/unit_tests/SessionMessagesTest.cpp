#include "SessionMessages.hpp"

#include "JsonLib.hpp"
#include "TestHeaders.hpp"

using namespace tg;

TEST_CASE("parseClientMessage reads input", "[SessionMessages]") {
  auto message = parseClientMessage(R"({"type":"input","data":"ls\r"})");
  REQUIRE(message);
  auto input = get_if<InputMessage>(&*message);
  REQUIRE(input);
  REQUIRE(input->data == "ls\r");
}

TEST_CASE("parseClientMessage reads resize", "[SessionMessages]") {
  auto message = parseClientMessage(R"({"type":"resize","cols":120,"rows":40})");
  REQUIRE(message);
  auto resize = get_if<ResizeMessage>(&*message);
  REQUIRE(resize);
  REQUIRE(resize->isValid());
  REQUIRE(*resize->cols == 120);
  REQUIRE(*resize->rows == 40);
}

TEST_CASE("Resize messages without usable dimensions are invalid",
          "[SessionMessages]") {
  vector<string> frames = {
      R"({"type":"resize"})",
      R"({"type":"resize","cols":120})",
      R"({"type":"resize","cols":0,"rows":40})",
      R"({"type":"resize","cols":120,"rows":-1})",
      R"({"type":"resize","cols":"120","rows":40})",
      R"({"type":"resize","cols":70000,"rows":40})",
      R"({"type":"resize","cols":1e300,"rows":40})",
  };
  for (const auto& frame : frames) {
    auto message = parseClientMessage(frame);
    REQUIRE(message);
    auto resize = get_if<ResizeMessage>(&*message);
    REQUIRE(resize);
    REQUIRE(!resize->isValid());
  }
}

TEST_CASE("parseClientMessage reads close-session", "[SessionMessages]") {
  auto message = parseClientMessage(R"({"type":"close-session"})");
  REQUIRE(message);
  REQUIRE(get_if<CloseSessionMessage>(&*message));
}

TEST_CASE("parseClientMessage ignores unknown types", "[SessionMessages]") {
  REQUIRE(!parseClientMessage(R"({"type":"ping"})"));
}

TEST_CASE("parseClientMessage rejects malformed frames", "[SessionMessages]") {
  REQUIRE_THROWS_AS(parseClientMessage("{not json"), runtime_error);
  REQUIRE_THROWS_AS(parseClientMessage("[1,2]"), runtime_error);
  REQUIRE_THROWS_AS(parseClientMessage(R"({"data":"x"})"), runtime_error);
  REQUIRE_THROWS_AS(parseClientMessage(R"({"type":"input","data":5})"),
                    runtime_error);
  REQUIRE_THROWS_AS(parseClientMessage(R"({"type":"input"})"), runtime_error);
}

TEST_CASE("serializeServerMessage writes output and error",
          "[SessionMessages]") {
  OutputMessage output;
  output.data = "hi\r\n";
  auto j = json::parse(serializeServerMessage(output));
  REQUIRE(j["type"] == "output");
  REQUIRE(j["data"] == "hi\r\n");

  ErrorMessage error;
  error.message = "Failed to create PTY";
  j = json::parse(serializeServerMessage(error));
  REQUIRE(j["type"] == "error");
  REQUIRE(j["message"] == "Failed to create PTY");
}

TEST_CASE("serializeServerMessage survives invalid UTF-8",
          "[SessionMessages]") {
  OutputMessage output;
  output.data = "ok\xFF";
  auto j = json::parse(serializeServerMessage(output));
  REQUIRE(j["type"] == "output");
  REQUIRE(j["data"].get<string>().find("ok") == 0);
}
