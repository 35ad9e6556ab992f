#ifndef __TG_ACTIVITY_REPORTER__
#define __TG_ACTIVITY_REPORTER__

#include "GatewayContext.hpp"
#include "Headers.hpp"

namespace tg {
/**
 * @brief Receives "a user is active on this host" signals.
 *
 * Called on every client message and periodically while a connection is
 * open.  Implementations throttle through `GatewayContext`.
 */
class ActivityReporter {
 public:
  virtual ~ActivityReporter() {}
  virtual void reportActivity(const string& sessionId) = 0;
};

/**
 * @brief Throttled reporter that records activity in the log.  Inert when no
 * sandbox id is configured.
 */
class LoggingActivityReporter : public ActivityReporter {
 public:
  explicit LoggingActivityReporter(shared_ptr<GatewayContext> _context)
      : context(_context) {}

  void reportActivity(const string& sessionId) override;

  /** @brief Number of reports that passed the throttle. */
  inline int getReportCount() const { return reportCount; }

 protected:
  shared_ptr<GatewayContext> context;
  int reportCount = 0;
};
}  // namespace tg

#endif  // __TG_ACTIVITY_REPORTER__
