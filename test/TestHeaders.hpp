#ifndef __TG_TEST_HEADERS__
#define __TG_TEST_HEADERS__

#include "Headers.hpp"
#include "catch2/catch.hpp"

namespace tg {
/**
 * @brief Runs `io` until `done()` holds or `timeout` passes.
 * @return The final value of `done()`.
 */
inline bool runUntil(asio::io_context& io, const function<bool()>& done,
                     chrono::milliseconds timeout = chrono::seconds(5)) {
  auto deadline = chrono::steady_clock::now() + timeout;
  while (!done() && chrono::steady_clock::now() < deadline) {
    if (io.stopped()) {
      io.restart();
    }
    io.run_for(chrono::milliseconds(10));
  }
  return done();
}
}  // namespace tg

#endif  // __TG_TEST_HEADERS__
