#include "ActivityReporter.hpp"

namespace tg {
void LoggingActivityReporter::reportActivity(const string& sessionId) {
  const auto& sandboxId = context->getConfig().sandboxId;
  if (sandboxId.empty()) {
    return;
  }
  if (!context->claimActivitySlot(chrono::steady_clock::now())) {
    return;
  }
  reportCount++;
  LOG(INFO) << "Activity on sandbox " << sandboxId << " (session "
            << sessionId << ")";
}
}  // namespace tg
