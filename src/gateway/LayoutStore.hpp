#ifndef __TG_LAYOUT_STORE__
#define __TG_LAYOUT_STORE__

#include "Headers.hpp"
#include "JsonLib.hpp"

namespace tg {
/**
 * @brief Persists the client's pane layout.  The gateway never looks inside
 * it.
 */
class LayoutStore {
 public:
  virtual ~LayoutStore() {}

  /**
   * @brief Loads the saved layout.
   * @return nullopt when nothing has been saved yet.
   * @throws std::runtime_error when a saved layout cannot be read.
   */
  virtual optional<json> get() = 0;

  /**
   * @brief Replaces the saved layout.
   * @throws std::runtime_error when it cannot be written.
   */
  virtual void set(const json& layout) = 0;
};

/**
 * @brief Keeps the layout in `<directory>/layout.json`.  Writes go to a
 * temporary file that is renamed over the old one, so readers never see a
 * partial layout.
 */
class FileLayoutStore : public LayoutStore {
 public:
  explicit FileLayoutStore(const string& _directory) : directory(_directory) {}

  optional<json> get() override;
  void set(const json& layout) override;

  inline string getPath() const { return directory + "/layout.json"; }

 protected:
  string directory;
};
}  // namespace tg

#endif  // __TG_LAYOUT_STORE__
