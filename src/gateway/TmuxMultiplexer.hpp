#ifndef __TG_TMUX_MULTIPLEXER__
#define __TG_TMUX_MULTIPLEXER__

#include "Headers.hpp"
#include "Multiplexer.hpp"
#include "SubprocessUtils.hpp"

namespace tg {
/**
 * @brief `Multiplexer` backed by the tmux command line.
 *
 * Targets use tmux's exact-match form (`=name`) so a session never matches
 * another one by prefix.
 */
class TmuxMultiplexer : public Multiplexer {
 public:
  /**
   * @param _tmuxBinary Executable name or path.
   * @param _socketName When non-empty, passed as `-L` to every invocation.
   */
  TmuxMultiplexer(shared_ptr<SubprocessUtils> _subprocessUtils,
                  const string& _tmuxBinary, const string& _socketName);

  bool isAvailable() override;
  bool exists(const string& name) override;
  bool createDetached(const string& name) override;
  SpawnCommand attachOrCreate(const string& name) override;
  void kill(const string& name) override;
  vector<string> list(const string& prefix) override;
  bool setOption(const string& target, const string& option,
                 const string& value) override;

 protected:
  shared_ptr<SubprocessUtils> subprocessUtils;
  string tmuxBinary;
  string socketName;

  /** @brief Prepends the socket selection arguments, if any. */
  vector<string> withSocket(const vector<string>& args) const;
  SubprocessResult runTmux(const vector<string>& args);
};
}  // namespace tg

#endif  // __TG_TMUX_MULTIPLEXER__
