#ifndef __TG_FAKE_MESSAGE_SINK__
#define __TG_FAKE_MESSAGE_SINK__

#include "JsonLib.hpp"
#include "SessionChannel.hpp"

namespace tg {
class FakeMessageSink : public MessageSink {
 public:
  FakeMessageSink() : closed(false) {}

  void sendText(const string& text) override {
    if (!closed) {
      sent.push_back(json::parse(text));
    }
  }
  void close() override { closed = true; }

  int countOfType(const string& type) const {
    int total = 0;
    for (const auto& it : sent) {
      if (it["type"] == type) {
        total++;
      }
    }
    return total;
  }

  vector<json> sent;
  bool closed;
};
}  // namespace tg

#endif  // __TG_FAKE_MESSAGE_SINK__
