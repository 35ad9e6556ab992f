#include "SessionMessages.hpp"

#include "JsonLib.hpp"

namespace tg {
namespace {
optional<int> readDimension(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_number()) {
    return nullopt;
  }
  double value = it->get<double>();
  if (value < -2147483648.0 || value > 2147483647.0) {
    return nullopt;
  }
  return int(value);
}
}  // namespace

optional<ClientMessage> parseClientMessage(const string& text) {
  json j;
  try {
    j = json::parse(text);
  } catch (const json::parse_error& e) {
    throw runtime_error(string("Invalid message: ") + e.what());
  }
  if (!j.is_object()) {
    throw runtime_error("Invalid message: not a JSON object");
  }
  auto typeIt = j.find("type");
  if (typeIt == j.end() || !typeIt->is_string()) {
    throw runtime_error("Invalid message: missing type");
  }
  string type = typeIt->get<string>();

  if (type == "input") {
    auto dataIt = j.find("data");
    if (dataIt == j.end() || !dataIt->is_string()) {
      throw runtime_error("Invalid input message: data must be a string");
    }
    InputMessage input;
    input.data = dataIt->get<string>();
    return ClientMessage(input);
  }
  if (type == "resize") {
    ResizeMessage resize;
    resize.cols = readDimension(j, "cols");
    resize.rows = readDimension(j, "rows");
    return ClientMessage(resize);
  }
  if (type == "close-session") {
    return ClientMessage(CloseSessionMessage());
  }
  return nullopt;
}

string serializeServerMessage(const ServerMessage& message) {
  json j;
  if (auto output = get_if<OutputMessage>(&message)) {
    j["type"] = "output";
    j["data"] = output->data;
  } else if (auto error = get_if<ErrorMessage>(&message)) {
    j["type"] = "error";
    j["message"] = error->message;
  }
  return dumpJson(j);
}
}  // namespace tg
